#include "symalg/errors.hpp"
#include "symalg/parser.hpp"
#include "symalg/tokenizer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using symalg::BinaryOp;
using symalg::Expression;
using symalg::ParserOptions;
using symalg::parse;

TEST(Parser, Scenario) {
    Expression tree = parse("(x * (2 + 3))");
    EXPECT_EQ(tree, symalg::mul("x", symalg::add(2, 3)));
}

TEST(Parser, Leaves) {
    EXPECT_EQ(parse("42"), Expression(42));
    EXPECT_EQ(parse("-2"), Expression(-2));
    EXPECT_EQ(parse("2.5"), Expression(2.5));
    EXPECT_EQ(parse("2.0"), Expression(2.0));
    EXPECT_NE(parse("2.0"), Expression(2));
    EXPECT_EQ(parse("1e3"), Expression(1000.0));
    EXPECT_EQ(parse("x"), Expression("x"));
    EXPECT_EQ(parse("x_1'"), Expression("x_1'"));
    // Любой токен, не являющийся числом, становится именем переменной
    EXPECT_EQ(parse("(+ + 1)"), symalg::add("+", 1));
}

TEST(Parser, AllOperators) {
    EXPECT_EQ(parse("(a + b)").op(), BinaryOp::Add);
    EXPECT_EQ(parse("(a - b)").op(), BinaryOp::Sub);
    EXPECT_EQ(parse("(a * b)").op(), BinaryOp::Mul);
    EXPECT_EQ(parse("(a / b)").op(), BinaryOp::Div);
    EXPECT_EQ(parse("(a ** b)").op(), BinaryOp::Pow);
    EXPECT_EQ(parse("(a - b)"), symalg::sub("a", "b"));
}

TEST(Parser, OperatorSymbols) {
    EXPECT_EQ(symalg::operatorFromSymbol("**"), BinaryOp::Pow);
    EXPECT_EQ(symalg::operatorFromSymbol("/"), BinaryOp::Div);
    EXPECT_FALSE(symalg::operatorFromSymbol("^").has_value());
    EXPECT_FALSE(symalg::operatorFromSymbol("***").has_value());
}

TEST(Parser, NestedExpressions) {
    Expression tree = parse("(((x ** 2) - (3 * x)) / (x + -1.5))");
    Expression expected = symalg::div(symalg::sub(symalg::pow("x", 2), symalg::mul(3, "x")),
                                      symalg::add("x", -1.5));
    EXPECT_EQ(tree, expected);
}

TEST(Parser, GroupingParentheses) {
    EXPECT_EQ(parse("(x)"), Expression("x"));
    EXPECT_EQ(parse("((x))"), Expression("x"));
    EXPECT_EQ(parse("((x + 1))"), symalg::add("x", 1));
    EXPECT_THROW(parse("(x)").eval({}), symalg::UndefinedVariable);
}

TEST(Parser, TrailingTokensIgnoredByDefault) {
    EXPECT_EQ(parse("(x + 1) garbage"), symalg::add("x", 1));
    EXPECT_EQ(parse("x y"), Expression("x"));
    EXPECT_EQ(parse("(x + 1) )"), symalg::add("x", 1));
}

TEST(Parser, TrailingTokensRejectedWhenConfigured) {
    ParserOptions options;
    options.rejectTrailingTokens = true;
    EXPECT_THROW(parse("(x + 1) garbage", options), symalg::ParseError);
    EXPECT_THROW(parse("x y", options), symalg::ParseError);
    EXPECT_EQ(parse("(x + 1)", options), symalg::add("x", 1));
}

TEST(Parser, MissingClosingParen) {
    EXPECT_THROW(parse("(x + 1"), symalg::ParseError);
    EXPECT_THROW(parse("((x + 1) * 2"), symalg::ParseError);

    ParserOptions lenient;
    lenient.requireClosingParen = false;
    EXPECT_EQ(parse("(x + 1", lenient), symalg::add("x", 1));
    // Токен на месте ')' пропускается без проверки
    EXPECT_EQ(parse("(x + 1 2)", lenient), symalg::add("x", 1));
    EXPECT_EQ(parse("((x + 1 ] * 2 ]", lenient), symalg::mul(symalg::add("x", 1), 2));
}

TEST(Parser, StructuralErrors) {
    EXPECT_THROW(parse(""), symalg::ParseError);
    EXPECT_THROW(parse("   "), symalg::ParseError);
    EXPECT_THROW(parse("("), symalg::ParseError);
    EXPECT_THROW(parse("(x"), symalg::ParseError);
    EXPECT_THROW(parse("(x +"), symalg::ParseError);
    EXPECT_THROW(parse("(x + )"), symalg::ParseError);
    EXPECT_THROW(parse("()"), symalg::ParseError);
    EXPECT_THROW(parse(")"), symalg::ParseError);
    EXPECT_THROW(parse("(( + x)"), symalg::ParseError);
}

TEST(Parser, UnknownOperator) {
    try {
        parse("(x % y)");
        FAIL() << "ожидалось UnknownOperator";
    }
    catch (const symalg::UnknownOperator& ex) {
        EXPECT_EQ(ex.symbol(), "%");
        EXPECT_EQ(ex.position(), 3u);
    }

    EXPECT_THROW(parse("(x ^ y)"), symalg::UnknownOperator);
    EXPECT_THROW(parse("(x y z)"), symalg::UnknownOperator);
    EXPECT_THROW(parse("(x (y + 1))"), symalg::UnknownOperator);
    // UnknownOperator - частный случай ParseError
    EXPECT_THROW(parse("(x // y)"), symalg::ParseError);
}

TEST(Parser, ErrorReportsPosition) {
    try {
        parse("(x + 1");
        FAIL() << "ожидалось ParseError";
    }
    catch (const symalg::ParseError& ex) {
        EXPECT_EQ(ex.position(), 6u);
        EXPECT_NE(std::string(ex.what()).find("6"), std::string::npos);
    }
}

TEST(Parser, DepthLimit) {
    ParserOptions options;
    options.maxDepth = 3;
    EXPECT_EQ(parse("(((x + 1) + 1) + 1)", options).left().left(), symalg::add("x", 1));
    EXPECT_THROW(parse("((((x + 1) + 1) + 1) + 1)", options), symalg::ParseError);
}

TEST(Parser, DeepNestingFailsCleanly) {
    const int depth = 100000;
    std::string text(depth, '(');
    text += "x";
    for (int i = 0; i < depth; ++i) {
        text += " + 1)";
    }
    EXPECT_THROW(parse(text), symalg::ParseError);
}

TEST(Parser, ModeratelyDeepNestingParses) {
    const int depth = 1000;
    std::string text(depth, '(');
    text += "x";
    for (int i = 0; i < depth; ++i) {
        text += " + 1)";
    }
    Expression tree = parse(text);
    EXPECT_DOUBLE_EQ(tree.eval({{"x", 0.0}}), 1000.0);
    EXPECT_EQ(tree.simplify(), tree);
}

TEST(Parser, AcceptsPrebuiltTokensWithoutEnd) {
    std::vector<symalg::Token> tokens = {
        {symalg::TokenType::LParen, "(", 0},
        {symalg::TokenType::Word, "x", 1},
        {symalg::TokenType::Word, "*", 3},
        {symalg::TokenType::Word, "2", 5},
        {symalg::TokenType::RParen, ")", 6},
    };
    symalg::Parser parser(tokens);
    EXPECT_EQ(parser.parse(), symalg::mul("x", 2));

    std::vector<symalg::Token> opening = {{symalg::TokenType::LParen, "(", 0}};
    symalg::Parser truncated(opening);
    EXPECT_THROW(truncated.parse(), symalg::ParseError);
}

TEST(Parser, ToSourceRoundTrip) {
    for (const char* text : {"(x * (2 + 3))", "((a - b) - c)", "(a ** (b ** c))", "((x / 2.5) + -3)"}) {
        Expression tree = parse(text);
        EXPECT_EQ(tree.toSource(), text);
        EXPECT_EQ(parse(tree.toSource()), tree);
    }
}
