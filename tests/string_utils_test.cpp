#include "enclave/utils/hash_utils.hpp"
#include "enclave/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace {

using ::enclave::utils::HashUtils;
using ::enclave::utils::StringUtils;
using ::testing::ElementsAre;
using ::testing::MatchesRegex;
using json = nlohmann::json;

TEST(StringUtilsTest, TrimAndCase) {
    EXPECT_EQ(StringUtils::Trim("  a b \n"), "a b");
    EXPECT_EQ(StringUtils::Trim(" \t "), "");
    EXPECT_EQ(StringUtils::ToLower("MiXeD"), "mixed");
}

TEST(StringUtilsTest, SplitSkipsEmptyTokens) {
    EXPECT_THAT(StringUtils::Split("a//b/", '/'), ElementsAre("a", "b"));
    EXPECT_THAT(StringUtils::SplitLines("one\r\n\ntwo\n"), ElementsAre("one", "two"));
    EXPECT_EQ(StringUtils::Join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(StringUtils::Join({}, ","), "");
}

TEST(StringUtilsTest, ShellQuoteSurvivesSingleQuotes) {
    EXPECT_EQ(StringUtils::ShellQuote("plain"), "'plain'");
    EXPECT_EQ(StringUtils::ShellQuote("it's"), "'it'\\''s'");
}

TEST(StringUtilsTest, UrlEncode) {
    EXPECT_EQ(StringUtils::UrlEncode("a b&c=d/é"), "a%20b%26c%3Dd%2F%C3%A9");
    EXPECT_EQ(StringUtils::UrlEncode("safe-_.~"), "safe-_.~");
}

TEST(StringUtilsTest, TruncateAddsSuffix) {
    EXPECT_EQ(StringUtils::Truncate("pip install pandas numpy", 10), "pip ins...");
    EXPECT_EQ(StringUtils::Truncate("short", 10), "short");
    EXPECT_EQ(StringUtils::Truncate("abcdef", 2), "ab");
}

TEST(StringUtilsTest, TruncateKeepsMultibyteCharactersWhole) {
    // "caf\xc3\xa9 au lait": cutting at 4 bytes would split the e-acute
    EXPECT_EQ(StringUtils::Truncate("caf\xc3\xa9 au lait", 7, "..."), "caf...");
    EXPECT_EQ(StringUtils::Utf8Prefix("caf\xc3\xa9", 4), "caf");
    EXPECT_EQ(StringUtils::Utf8Prefix("caf\xc3\xa9", 5), "caf\xc3\xa9");
}

TEST(StringUtilsTest, ToValidUtf8ReplacesInvalidBytes) {
    const std::string replacement = "\xEF\xBF\xBD";

    EXPECT_EQ(StringUtils::ToValidUtf8("plain text\n"), "plain text\n");
    EXPECT_EQ(StringUtils::ToValidUtf8("r\xc3\xa9sultat \xe2\x82\xac \xf0\x9f\x98\x80"),
              "r\xc3\xa9sultat \xe2\x82\xac \xf0\x9f\x98\x80");
    EXPECT_EQ(StringUtils::ToValidUtf8("\xff\xfe"), replacement + replacement);
    EXPECT_EQ(StringUtils::ToValidUtf8("\xa9sultat"), replacement + "sultat");
    // Overlong slash, encoded surrogate and a sequence cut short by the end of input
    EXPECT_EQ(StringUtils::ToValidUtf8("\xc0\xaf"), replacement + replacement);
    EXPECT_EQ(StringUtils::ToValidUtf8("\xed\xa0\x80"), replacement + replacement + replacement);
    EXPECT_EQ(StringUtils::ToValidUtf8("ok\xe2\x82"), "ok" + replacement);

    EXPECT_NO_THROW(json(StringUtils::ToValidUtf8("\x80\x81" "binary\xfe")).dump());
}

TEST(HashUtilsTest, Sha256OfKnownInput) {
    EXPECT_EQ(HashUtils::ComputeSHA256(std::string("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(HashUtils::ComputeSHA256(std::string()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashUtilsTest, FileDigestMatchesBufferDigest) {
    auto path = std::filesystem::temp_directory_path() / "enclave_hash_test.bin";
    std::string content(20000, 'z');
    {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    EXPECT_EQ(HashUtils::ComputeSHA256(path), HashUtils::ComputeSHA256(content));
    std::filesystem::remove(path);

    EXPECT_THROW(HashUtils::ComputeSHA256(std::filesystem::path("/nonexistent/enclave")),
                 std::runtime_error);
}

TEST(HashUtilsTest, RandomHexHasTwoDigitsPerByte) {
    auto id = HashUtils::RandomHex(8);
    EXPECT_THAT(id, MatchesRegex("[0-9a-f]{16}"));
    EXPECT_NE(id, HashUtils::RandomHex(8));
}

} // namespace
