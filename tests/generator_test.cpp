#include "symalg/errors.hpp"
#include "symalg/expression_generator.hpp"
#include "symalg/parser.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

using symalg::BinaryOp;
using symalg::Expression;
using symalg::ExpressionGenerator;
using symalg::GeneratorConfig;

namespace {
int depthOf(const Expression& expression) {
    if (!expression.isBinary()) {
        return 0;
    }
    return 1 + std::max(depthOf(expression.left()), depthOf(expression.right()));
}

bool allExponentsConstant(const Expression& expression) {
    if (!expression.isBinary()) {
        return true;
    }
    if (expression.op() == BinaryOp::Pow && !expression.right().isNumber()) {
        return false;
    }
    return allExponentsConstant(expression.left()) && allExponentsConstant(expression.right());
}
}

TEST(Generator, SameSeedSameExpressions) {
    ExpressionGenerator first(GeneratorConfig{}, 42);
    ExpressionGenerator second(GeneratorConfig{}, 42);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(first.generate(4), second.generate(4));
    }
}

TEST(Generator, ZeroDepthGivesLeaf) {
    ExpressionGenerator generator(GeneratorConfig{}, 1);
    for (int i = 0; i < 50; ++i) {
        EXPECT_FALSE(generator.generate(0).isBinary());
    }
}

TEST(Generator, RespectsDepthAndExponents) {
    GeneratorConfig config;
    config.leafProbability = 0.0;
    ExpressionGenerator generator(config, 7);
    for (int i = 0; i < 100; ++i) {
        Expression tree = generator.generate(5);
        EXPECT_LE(depthOf(tree), 5);
        EXPECT_TRUE(allExponentsConstant(tree));
        EXPECT_NO_THROW(tree.deriv("x"));
    }
}

TEST(Generator, UsesOnlyConfiguredVocabulary) {
    GeneratorConfig config;
    config.variables = {"t"};
    config.operators = {BinaryOp::Mul};
    config.minNumber = 2;
    config.maxNumber = 2;
    config.floatProbability = 0.0;
    ExpressionGenerator generator(config, 3);

    for (int i = 0; i < 30; ++i) {
        Expression tree = generator.generate(3);
        for (const auto& name : tree.collectVariables()) {
            EXPECT_EQ(name, "t");
        }
        EXPECT_GT(tree.eval({{"t", 2.0}}), 0.0);
    }
}

TEST(Generator, TextParsesBack) {
    ExpressionGenerator generator(GeneratorConfig{}, 11);
    for (int i = 0; i < 100; ++i) {
        std::string text = generator.generateText(4);
        EXPECT_NO_THROW(symalg::parse(text)) << text;
    }
}

TEST(Generator, InjectedErrorsFailToParse) {
    GeneratorConfig config;
    config.errorProbability = 1.0;
    ExpressionGenerator generator(config, 1);

    for (int i = 0; i < 400; ++i) {
        std::string text = generator.generateText(i % 4);
        EXPECT_THROW(symalg::parse(text), symalg::ParseError) << text;
    }
}

TEST(Generator, InjectedErrorsBreakSingleLeaves) {
    GeneratorConfig config;
    config.errorProbability = 1.0;
    ExpressionGenerator generator(config, 9);

    for (int i = 0; i < 100; ++i) {
        std::string text = generator.generateText(0);
        EXPECT_THROW(symalg::parse(text), symalg::ParseError) << text;
    }
}

TEST(Generator, RejectsInvalidConfig) {
    GeneratorConfig noOperators;
    noOperators.operators.clear();
    EXPECT_THROW(ExpressionGenerator(noOperators, 1), std::invalid_argument);

    GeneratorConfig badRange;
    badRange.minNumber = 5;
    badRange.maxNumber = 1;
    EXPECT_THROW(ExpressionGenerator(badRange, 1), std::invalid_argument);
}
