#include <gtest/gtest.h>
#include "stencil/engine/tag_scanner.hpp"

using namespace stencil::engine;

class TagScannerTest : public ::testing::Test {
protected:
    std::unique_ptr<ITagScanner> scanner = create_tag_scanner();

    static std::string concat_raw(const std::vector<ScanToken>& tokens) {
        std::string out;
        for (const auto& token : tokens) out += token.raw;
        return out;
    }
};

TEST_F(TagScannerTest, PlainTextIsOneToken) {
    auto tokens = scanner->scan("no tags here");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Text);
    EXPECT_EQ(tokens[0].raw, "no tags here");
    EXPECT_EQ(tokens[0].offset, 0u);
}

TEST_F(TagScannerTest, EmptySourceHasNoTokens) {
    EXPECT_TRUE(scanner->scan("").empty());
}

TEST_F(TagScannerTest, VariableBetweenText) {
    auto tokens = scanner->scan("Hi {{name}}!");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], (ScanToken{TokenKind::Text, "", "Hi ", 0}));
    EXPECT_EQ(tokens[1], (ScanToken{TokenKind::Variable, "name", "{{name}}", 3}));
    EXPECT_EQ(tokens[2], (ScanToken{TokenKind::Text, "", "!", 11}));
}

TEST_F(TagScannerTest, TagKinds) {
    auto tokens = scanner->scan("{{#a}}{{^b}}{{/c}}{{&d}}{{{e}}}");
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].kind, TokenKind::SectionOpen);
    EXPECT_EQ(tokens[0].name, "a");
    EXPECT_EQ(tokens[1].kind, TokenKind::InvertedOpen);
    EXPECT_EQ(tokens[1].name, "b");
    EXPECT_EQ(tokens[2].kind, TokenKind::SectionClose);
    EXPECT_EQ(tokens[2].name, "c");
    EXPECT_EQ(tokens[3].kind, TokenKind::RawVariable);
    EXPECT_EQ(tokens[3].name, "d");
    EXPECT_EQ(tokens[4].kind, TokenKind::RawVariable);
    EXPECT_EQ(tokens[4].name, "e");
    EXPECT_EQ(tokens[4].raw, "{{{e}}}");
    EXPECT_EQ(tokens[4].offset, 24u);
}

TEST_F(TagScannerTest, NamesAreTrimmed) {
    auto tokens = scanner->scan("{{ # items }}");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, TokenKind::SectionOpen);
    EXPECT_EQ(tokens[0].name, "items");
}

TEST_F(TagScannerTest, NamesAreNotValidated) {
    auto tokens = scanner->scan("{{a b}}{{}}");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].name, "a b");
    EXPECT_EQ(tokens[1].kind, TokenKind::Variable);
    EXPECT_EQ(tokens[1].name, "");
}

TEST_F(TagScannerTest, UnterminatedTagConsumesRest) {
    auto tokens = scanner->scan("ok {{name and more");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[1].kind, TokenKind::Unterminated);
    EXPECT_EQ(tokens[1].offset, 3u);
    EXPECT_EQ(tokens[1].raw, "{{name and more");
}

TEST_F(TagScannerTest, TokensTileTheSource) {
    std::string source = "a{{#s}}\n {{x}} {{{y}}}{{/s}} tail {{oops";
    auto tokens = scanner->scan(source);
    EXPECT_EQ(concat_raw(tokens), source);

    std::size_t expected_offset = 0;
    for (const auto& token : tokens) {
        EXPECT_EQ(token.offset, expected_offset);
        expected_offset += token.raw.size();
    }
}

TEST_F(TagScannerTest, DefaultScannerIsShared) {
    EXPECT_EQ(&default_tag_scanner(), &default_tag_scanner());
    EXPECT_EQ(default_tag_scanner().scan("{{x}}").size(), 1u);
}
