#include <gtest/gtest.h>
#include "fastpack/crypto/hash.hpp"
#include "fastpack/crypto/random.hpp"
#include <set>
#include <vector>

using namespace fastpack::crypto;

class HashTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecureRandom::initialize());
    }
};

TEST_F(HashTest, KnownDigest) {
    auto digest = ContentHasher::hash(std::span<const uint8_t>{});
    EXPECT_EQ(hash_utils::hash_to_hex(digest),
              "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
}

TEST_F(HashTest, HexIsLowercaseAndZeroPadded) {
    ContentHash digest{};
    digest[0] = 0x0a;
    digest[31] = 0xf0;
    
    auto hex = hash_utils::hash_to_hex(digest);
    ASSERT_EQ(hex.size(), CONTENT_HASH_SIZE * 2);
    EXPECT_EQ(hex.substr(0, 4), "0a00");
    EXPECT_EQ(hex.substr(60), "00f0");
}

TEST_F(HashTest, ContentTagDependsOnBytes) {
    std::vector<uint8_t> a{1, 2, 3};
    std::vector<uint8_t> b{1, 2, 4};
    
    EXPECT_EQ(hash_utils::content_tag(a), hash_utils::content_tag(a));
    EXPECT_NE(hash_utils::content_tag(a), hash_utils::content_tag(b));
    EXPECT_EQ(hash_utils::content_tag(a), hash_utils::hash_to_hex(ContentHasher::hash(a)));
}

TEST_F(HashTest, GeneratedIdsAreLowercaseAlphanumeric) {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto id = SecureRandom::generate_id();
        ASSERT_EQ(id.size(), 8u);
        for (char c : id) {
            EXPECT_TRUE((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) << id;
        }
        seen.insert(id);
    }
    EXPECT_GT(seen.size(), 190u);
    
    EXPECT_EQ(SecureRandom::generate_id(16).size(), 16u);
}

TEST_F(HashTest, UniformStaysBelowBound) {
    for (int i = 0; i < 1000; ++i) {
        EXPECT_LT(SecureRandom::generate_uniform(7), 7u);
    }
}
