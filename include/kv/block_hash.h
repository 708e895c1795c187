#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kvplane {

using Token = uint32_t;

/// Content hash of one full block of tokens, chained with its parent block so
/// that equal hashes imply equal prefixes.
using SequenceHash = uint64_t;

constexpr uint32_t kDefaultBlockSize = 16;

/// Hash every full block of `tokens`. A trailing partial block is not hashed.
/// Throws std::invalid_argument when block_size is 0.
std::vector<SequenceHash> computeBlockHashes(const std::vector<Token>& tokens, uint32_t block_size);

/// Hash a single block given its parent (nullptr for the first block).
SequenceHash hashBlock(const SequenceHash* parent, const Token* tokens, size_t count);

/// Blocks a request of `tokens` tokens occupies once fully resident (rounded up).
inline uint64_t blocksForTokens(uint64_t tokens, uint32_t block_size) {
    if (block_size == 0) return 0;
    return (tokens + block_size - 1) / block_size;
}

}  // namespace kvplane
