#include <gtest/gtest.h>

#include <cctype>
#include <set>
#include <string>

#include "utils/request_id.h"
#include "utils/url_encode.h"

using namespace kvplane;

TEST(UrlEncodeTest, KeepsUnreservedCharacters) {
    EXPECT_EQ(urlEncode("kvplane-0.1_beta~x"), "kvplane-0.1_beta~x");
}

TEST(UrlEncodeTest, PercentEncodesEverythingElse) {
    EXPECT_EQ(urlEncode("a b/c"), "a%20b%2Fc");
    EXPECT_EQ(urlEncode("sum(rate(x[1m]))"), "sum%28rate%28x%5B1m%5D%29%29");
}

TEST(UrlEncodeTest, BuildsQueryString) {
    EXPECT_EQ(buildQueryString({}), "");
    EXPECT_EQ(buildQueryString({{"query", "up"}, {"step", "15s"}}), "?query=up&step=15s");
    EXPECT_EQ(buildQueryString({{"query", "a+b"}}), "?query=a%2Bb");
}

TEST(RequestIdTest, GeneratesSixteenHexCharacters) {
    auto id = generate_request_id();
    ASSERT_EQ(id.size(), 16u);
    for (char c : id) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << id;
    }
}

TEST(RequestIdTest, IdsDoNotRepeat) {
    std::set<std::string> seen;
    for (int i = 0; i < 256; ++i) {
        seen.insert(generate_request_id());
    }
    EXPECT_EQ(seen.size(), 256u);
}
