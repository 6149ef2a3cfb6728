#include "symalg/tokenizer.hpp"

#include <gtest/gtest.h>

using symalg::Token;
using symalg::TokenType;
using symalg::Tokenizer;

namespace {
std::vector<std::string> texts(const std::vector<Token>& tokens) {
    std::vector<std::string> result;
    for (const auto& token : tokens) {
        if (token.type != TokenType::End) {
            result.push_back(token.text);
        }
    }
    return result;
}
}

TEST(Tokenizer, SplitsParenthesesAndWhitespace) {
    auto tokens = Tokenizer("(x * (2 + 3))").tokenize();
    std::vector<std::string> expected = {"(", "x", "*", "(", "2", "+", "3", ")", ")"};
    EXPECT_EQ(texts(tokens), expected);
    ASSERT_EQ(tokens.size(), expected.size() + 1);
    EXPECT_EQ(tokens.back().type, TokenType::End);
    EXPECT_EQ(tokens.front().type, TokenType::LParen);
    EXPECT_EQ(tokens[1].type, TokenType::Word);
    EXPECT_EQ(tokens[7].type, TokenType::RParen);
}

TEST(Tokenizer, RecordsPositions) {
    auto tokens = Tokenizer("(x * (2 + 3))").tokenize();
    EXPECT_EQ(tokens[0].position, 0u);
    EXPECT_EQ(tokens[1].position, 1u);
    EXPECT_EQ(tokens[2].position, 3u);
    EXPECT_EQ(tokens[4].position, 6u);
    EXPECT_EQ(tokens.back().position, 13u);
}

TEST(Tokenizer, ParenthesesSeparateAdjacentText) {
    std::vector<std::string> expected = {"(", "(", "x", "**", "2", ")", "-", "y", ")"};
    EXPECT_EQ(texts(Tokenizer("((x ** 2)-y)").tokenize()), std::vector<std::string>({"(", "(", "x", "**", "2", ")", "-y", ")"}));
    EXPECT_EQ(texts(Tokenizer("((x ** 2) - y)").tokenize()), expected);
}

TEST(Tokenizer, OperatorsNeedWhitespace) {
    // Без пробелов "a+b" остаётся одним словом
    std::vector<std::string> expected = {"(", "a+b", ")"};
    EXPECT_EQ(texts(Tokenizer("(a+b)").tokenize()), expected);
}

TEST(Tokenizer, AnyWhitespaceSeparates) {
    std::vector<std::string> expected = {"(", "x", "+", "1.5", ")"};
    EXPECT_EQ(texts(Tokenizer("\t( x\n+   1.5 )\r\n").tokenize()), expected);
}

TEST(Tokenizer, EmptyInputHasOnlyEnd) {
    auto tokens = Tokenizer("").tokenize();
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::End);

    EXPECT_EQ(Tokenizer("   ").tokenize().size(), 1u);
}
