#include "chronicle/parser/Tokenizer.hh"
#include <gtest/gtest.h>

using namespace chronicle;

namespace {

std::vector<TokenType> typesOf(const std::vector<Token>& tokens) {
    std::vector<TokenType> types;
    for (const auto& token : tokens) {
        types.push_back(token.type);
    }
    return types;
}

} // namespace

TEST(TokenizerTest, EmptyInputYieldsOnlyEof) {
    auto tokens = tokenize("");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::Eof);
}

TEST(TokenizerTest, ClassifiesStructuralTokens) {
    auto tokens = tokenize("a={ b }");
    EXPECT_EQ(typesOf(tokens), (std::vector<TokenType>{TokenType::String, TokenType::Equal, TokenType::BraceOpen,
                                                       TokenType::String, TokenType::BraceClose, TokenType::Eof}));
}

TEST(TokenizerTest, IntegersAndFloats) {
    auto tokens = tokenize("42 -7 +3 1.5 -0.25 2. 1.0e3 12a 1.2.3");
    ASSERT_EQ(tokens.size(), 10u);
    EXPECT_EQ(tokens[0].type, TokenType::Integer);
    EXPECT_EQ(tokens[0].asInt(), 42);
    EXPECT_EQ(tokens[1].asInt(), -7);
    EXPECT_EQ(tokens[2].asInt(), 3);
    EXPECT_EQ(tokens[3].type, TokenType::Float);
    EXPECT_DOUBLE_EQ(tokens[3].asFloat(), 1.5);
    EXPECT_DOUBLE_EQ(tokens[4].asFloat(), -0.25);
    EXPECT_EQ(tokens[5].type, TokenType::Float);
    EXPECT_DOUBLE_EQ(tokens[6].asFloat(), 1000.0);
    EXPECT_EQ(tokens[7].type, TokenType::String);
    EXPECT_EQ(tokens[7].asString(), "12a");
    EXPECT_EQ(tokens[8].type, TokenType::String);
}

TEST(TokenizerTest, QuotedStringsKeepContentVerbatim) {
    auto tokens = tokenize(R"(name="Sol { = } 3" id="10")");
    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[2].type, TokenType::String);
    EXPECT_EQ(tokens[2].asString(), "Sol { = } 3");
    // Quoted digits stay a string.
    EXPECT_EQ(tokens[5].type, TokenType::String);
    EXPECT_EQ(tokens[5].asString(), "10");
}

TEST(TokenizerTest, EscapedQuotesInsideStrings) {
    auto tokens = tokenize(R"("say \"hi\"")");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].asString(), "say \"hi\"");
}

TEST(TokenizerTest, TracksLineNumbers) {
    auto tokens = tokenize("a=1\nb=\"two\nlines\"\nc=3");
    ASSERT_EQ(tokens.size(), 10u);
    EXPECT_EQ(tokens[0].line, 1);
    EXPECT_EQ(tokens[3].line, 2);
    EXPECT_EQ(tokens[5].line, 2);
    EXPECT_EQ(tokens[6].line, 4);
    EXPECT_EQ(tokens[9].type, TokenType::Eof);
}

TEST(TokenizerTest, UnterminatedQuoteIsStillTotal) {
    auto tokens = tokenize("a=\"open");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[2].asString(), "open");
    EXPECT_EQ(tokens[3].type, TokenType::Eof);
}

TEST(TokenizerTest, NextKeepsReturningEof) {
    Tokenizer tokenizer("x");
    EXPECT_EQ(tokenizer.next().type, TokenType::String);
    EXPECT_EQ(tokenizer.next().type, TokenType::Eof);
    EXPECT_EQ(tokenizer.next().type, TokenType::Eof);
}

TEST(TokenizerTest, HugeIntegerBecomesFloat) {
    auto token = classifyUnit("123456789012345678901234", 1);
    EXPECT_EQ(token.type, TokenType::Float);
}

TEST(TokenizerTest, StripCommentsOutsideQuotes) {
    std::string text = "a=1 # trailing\n# whole line\nb=\"#not a comment\"";
    EXPECT_EQ(stripComments(text), "a=1 \n\nb=\"#not a comment\"");
}

TEST(TokenizerTest, TokenTypeNames) {
    EXPECT_EQ(tokenTypeToString(TokenType::BraceOpen), "BRACE_OPEN");
    EXPECT_EQ(tokenTypeToString(TokenType::Eof), "EOF");
}
