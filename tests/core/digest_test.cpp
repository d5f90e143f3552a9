#include "nexus/core/digest.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>

using namespace nexus::core;
namespace fs = std::filesystem;

TEST(DigestTest, Sha256KnownVectors) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, Sha256FileMatchesInMemory) {
    auto path = fs::temp_directory_path() / "nexus_digest_test.bin";
    std::string content(10000, 'x');
    {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    auto result = sha256_file(path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), sha256_hex(content));

    std::atomic<bool> cancel{true};
    EXPECT_TRUE(sha256_file(path, &cancel).is_error());

    fs::remove(path);
    EXPECT_TRUE(sha256_file(path).is_error());
}

TEST(DigestTest, HmacKnownVector) {
    // RFC 4231 test case 2
    std::vector<std::uint8_t> key{'J', 'e', 'f', 'e'};
    EXPECT_EQ(to_hex(hmac_sha256(key, "what do ya want for nothing?")),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(DigestTest, Base64) {
    EXPECT_EQ(base64_encode("a.txt"), "YS50eHQ=");
    EXPECT_EQ(base64_encode(""), "");

    auto decoded = base64_decode("dGV4dC9wbGFpbg==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "text/plain");

    EXPECT_EQ(base64_decode("YWI=").value_or("?"), "ab");
    EXPECT_EQ(base64_decode("").value_or("?"), "");
    EXPECT_FALSE(base64_decode("abc").has_value());
    EXPECT_FALSE(base64_decode("a$c=").has_value());
}

TEST(DigestTest, DigestEquals) {
    EXPECT_TRUE(digest_equals("abcd", "abcd"));
    EXPECT_FALSE(digest_equals("abcd", "abce"));
    EXPECT_FALSE(digest_equals("abcd", "abc"));
}

TEST(DigestTest, RandomIdsAreHexAndDistinct) {
    auto a = random_hex_id();
    auto b = random_hex_id();
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}
