#include "symalg/analyzer.hpp"

#include <gtest/gtest.h>

using symalg::AnalysisRecord;
using symalg::ExpressionAnalyzer;

TEST(Analyzer, FullPipeline) {
    ExpressionAnalyzer analyzer("x", {{"x", 4.0}});
    AnalysisRecord record = analyzer.analyze("(x * (2 + 3))", 7);

    EXPECT_TRUE(record.succeeded());
    EXPECT_EQ(record.lineNumber, 7u);
    EXPECT_EQ(record.expression, "(x * (2 + 3))");
    EXPECT_EQ(record.rendered, "x * (2 + 3)");
    EXPECT_EQ(record.simplified, "x * 5");
    EXPECT_EQ(record.derivative, "5");
    ASSERT_TRUE(record.value.has_value());
    EXPECT_DOUBLE_EQ(*record.value, 20.0);
    EXPECT_TRUE(record.message.empty());
}

TEST(Analyzer, DefaultsDifferentiateByX) {
    ExpressionAnalyzer analyzer;
    EXPECT_EQ(analyzer.variable(), "x");
    AnalysisRecord record = analyzer.analyze("(x ** 2)");
    EXPECT_EQ(record.derivative, "2 * x");
    EXPECT_FALSE(record.succeeded());
    EXPECT_FALSE(record.value.has_value());
}

TEST(Analyzer, ParseErrorStopsPipeline) {
    ExpressionAnalyzer analyzer("x", {{"x", 1.0}});
    AnalysisRecord record = analyzer.analyze("(x + 1", 3);

    EXPECT_FALSE(record.succeeded());
    EXPECT_EQ(record.status, "error");
    EXPECT_TRUE(record.rendered.empty());
    EXPECT_TRUE(record.simplified.empty());
    EXPECT_TRUE(record.derivative.empty());
    EXPECT_FALSE(record.value.has_value());
    EXPECT_FALSE(record.message.empty());
}

TEST(Analyzer, UnknownOperatorReported) {
    ExpressionAnalyzer analyzer;
    AnalysisRecord record = analyzer.analyze("(x % y)");
    EXPECT_FALSE(record.succeeded());
    EXPECT_NE(record.message.find('%'), std::string::npos);
}

TEST(Analyzer, UndefinedVariableKeepsOtherFields) {
    ExpressionAnalyzer analyzer("x", {{"x", 2.0}});
    AnalysisRecord record = analyzer.analyze("(x + y)");

    EXPECT_FALSE(record.succeeded());
    EXPECT_EQ(record.rendered, "x + y");
    EXPECT_EQ(record.simplified, "x + y");
    EXPECT_EQ(record.derivative, "1");
    EXPECT_FALSE(record.value.has_value());
    EXPECT_NE(record.message.find("'y'"), std::string::npos);
}

TEST(Analyzer, NotConstantExponentStillEvaluates) {
    ExpressionAnalyzer analyzer("x", {{"x", 2.0}, {"y", 3.0}});
    AnalysisRecord record = analyzer.analyze("(x ** y)");

    EXPECT_FALSE(record.succeeded());
    EXPECT_TRUE(record.derivative.empty());
    ASSERT_TRUE(record.value.has_value());
    EXPECT_DOUBLE_EQ(*record.value, 8.0);
    EXPECT_NE(record.message.find("y"), std::string::npos);
}

TEST(Analyzer, FirstErrorWins) {
    ExpressionAnalyzer analyzer("x", {});
    AnalysisRecord record = analyzer.analyze("(x ** y)");

    EXPECT_FALSE(record.succeeded());
    // Производная упала раньше вычисления
    EXPECT_NE(record.message.find("Показатель"), std::string::npos);
}

TEST(Analyzer, DivisionByZeroReported) {
    ExpressionAnalyzer analyzer("x", {{"x", 0.0}});
    AnalysisRecord record = analyzer.analyze("(1 / x)");

    EXPECT_FALSE(record.succeeded());
    EXPECT_EQ(record.simplified, "1 / x");
    EXPECT_FALSE(record.value.has_value());
}

TEST(Analyzer, StrictOptionsApplied) {
    symalg::ParserOptions options;
    options.rejectTrailingTokens = true;
    ExpressionAnalyzer lenient("x", {{"x", 1.0}});
    ExpressionAnalyzer strict("x", {{"x", 1.0}}, options);

    EXPECT_TRUE(lenient.analyze("(x + 1) junk").succeeded());
    EXPECT_FALSE(strict.analyze("(x + 1) junk").succeeded());
}
