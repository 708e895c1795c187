#include "kv/block_hash.h"

#include <array>
#include <stdexcept>

#include <openssl/evp.h>

namespace kvplane {

namespace {

void appendLittleEndian(std::vector<unsigned char>& out, uint64_t value, size_t bytes) {
    for (size_t i = 0; i < bytes; ++i) {
        out.push_back(static_cast<unsigned char>((value >> (8 * i)) & 0xFF));
    }
}

}  // namespace

SequenceHash hashBlock(const SequenceHash* parent, const Token* tokens, size_t count) {
    std::vector<unsigned char> buf;
    buf.reserve(8 + count * 4);
    if (parent != nullptr) {
        appendLittleEndian(buf, *parent, 8);
    }
    for (size_t i = 0; i < count; ++i) {
        appendLittleEndian(buf, tokens[i], 4);
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(buf.data(), buf.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1 ||
        digest_len < 8) {
        throw std::runtime_error("SHA-256 digest failed while hashing KV block");
    }

    SequenceHash out = 0;
    for (size_t i = 0; i < 8; ++i) {
        out |= static_cast<SequenceHash>(digest[i]) << (8 * i);
    }
    return out;
}

std::vector<SequenceHash> computeBlockHashes(const std::vector<Token>& tokens, uint32_t block_size) {
    if (block_size == 0) {
        throw std::invalid_argument("block_size cannot be 0");
    }
    const size_t full_blocks = tokens.size() / block_size;
    std::vector<SequenceHash> hashes;
    hashes.reserve(full_blocks);
    for (size_t i = 0; i < full_blocks; ++i) {
        const SequenceHash* parent = hashes.empty() ? nullptr : &hashes.back();
        hashes.push_back(hashBlock(parent, tokens.data() + i * block_size, block_size));
    }
    return hashes;
}

}  // namespace kvplane
