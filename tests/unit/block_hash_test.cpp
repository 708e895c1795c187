#include <gtest/gtest.h>

#include <numeric>
#include <stdexcept>
#include <vector>

#include "kv/block_hash.h"

using namespace kvplane;

namespace {

std::vector<Token> iota(size_t n, Token start = 0) {
    std::vector<Token> tokens(n);
    std::iota(tokens.begin(), tokens.end(), start);
    return tokens;
}

}  // namespace

TEST(BlockHashTest, PartialTrailingBlockIsNotHashed) {
    EXPECT_EQ(computeBlockHashes(iota(15), 16).size(), 0u);
    EXPECT_EQ(computeBlockHashes(iota(16), 16).size(), 1u);
    EXPECT_EQ(computeBlockHashes(iota(33), 16).size(), 2u);
    EXPECT_TRUE(computeBlockHashes({}, 16).empty());
}

TEST(BlockHashTest, ZeroBlockSizeThrows) {
    EXPECT_THROW(computeBlockHashes(iota(8), 0), std::invalid_argument);
}

TEST(BlockHashTest, IsDeterministic) {
    auto a = computeBlockHashes(iota(64), 16);
    auto b = computeBlockHashes(iota(64), 16);
    EXPECT_EQ(a, b);
}

TEST(BlockHashTest, SharedPrefixYieldsSharedLeadingHashes) {
    auto base = iota(48);
    auto other = base;
    other[40] = 9999;  // differs in block 2 only

    auto a = computeBlockHashes(base, 16);
    auto b = computeBlockHashes(other, 16);
    ASSERT_EQ(a.size(), 3u);
    ASSERT_EQ(b.size(), 3u);
    EXPECT_EQ(a[0], b[0]);
    EXPECT_EQ(a[1], b[1]);
    EXPECT_NE(a[2], b[2]);
}

TEST(BlockHashTest, HashDependsOnParentBlock) {
    // Same second block content behind different first blocks.
    auto a = iota(32);
    auto b = iota(32);
    b[0] = 7777;

    auto ha = computeBlockHashes(a, 16);
    auto hb = computeBlockHashes(b, 16);
    EXPECT_NE(ha[0], hb[0]);
    EXPECT_NE(ha[1], hb[1]);

    // The unchained hash of block 1 alone matches neither.
    SequenceHash standalone = hashBlock(nullptr, a.data() + 16, 16);
    EXPECT_NE(standalone, ha[1]);
    EXPECT_EQ(hashBlock(&ha[0], a.data() + 16, 16), ha[1]);
}

TEST(BlockHashTest, BlockSizeChangesHashes) {
    auto tokens = iota(32);
    auto by16 = computeBlockHashes(tokens, 16);
    auto by32 = computeBlockHashes(tokens, 32);
    ASSERT_EQ(by32.size(), 1u);
    EXPECT_NE(by16[0], by32[0]);
}

TEST(BlockHashTest, BlocksForTokensRoundsUp) {
    EXPECT_EQ(blocksForTokens(0, 16), 0u);
    EXPECT_EQ(blocksForTokens(1, 16), 1u);
    EXPECT_EQ(blocksForTokens(16, 16), 1u);
    EXPECT_EQ(blocksForTokens(17, 16), 2u);
    EXPECT_EQ(blocksForTokens(10, 0), 0u);
}
