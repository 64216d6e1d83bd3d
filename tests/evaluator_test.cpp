#include "evaluator.hpp"

#include "errors.hpp"
#include "expression.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace grapher;

namespace {
double eval(const std::string& text, double x = 0.0) {
    return Expression::compile(text).evaluate({{"x", x}});
}

DomainErrorKind failureOf(const std::string& text, double x = 0.0) {
    try {
        eval(text, x);
    }
    catch (const DomainError& error) {
        return error.kind();
    }
    throw std::runtime_error("DomainError expected for: " + text);
}
}

TEST(EvaluatorTest, ConstantEvaluatesToItsLiteral) {
    EXPECT_EQ(eval("0.1"), 0.1);
    EXPECT_EQ(eval("1.5e-3"), 1.5e-3);
    EXPECT_EQ(eval("123456789"), 123456789.0);
}

TEST(EvaluatorTest, VariableEvaluatesToItsBinding) {
    for (double v : {-2.5, 0.0, 1e-300, 7.0, 1e300}) {
        EXPECT_EQ(eval("x", v), v);
    }
}

TEST(EvaluatorTest, ArithmeticAndPrecedence) {
    EXPECT_DOUBLE_EQ(eval("3 + x * 2", 2.0), 7.0);
    EXPECT_DOUBLE_EQ(eval("(3 + x) * 2", 2.0), 10.0);
    EXPECT_DOUBLE_EQ(eval("1 - 2 - 3"), -4.0);
    EXPECT_DOUBLE_EQ(eval("8 / 4 / 2"), 1.0);
    EXPECT_DOUBLE_EQ(eval("2^3^2"), 512.0);
    EXPECT_DOUBLE_EQ(eval("-x^2", 3.0), -9.0);
    EXPECT_DOUBLE_EQ(eval("2^-1"), 0.5);
    EXPECT_DOUBLE_EQ(eval("+x", 4.0), 4.0);
}

TEST(EvaluatorTest, StandardFunctions) {
    EXPECT_DOUBLE_EQ(eval("sin(x)", 1.0), std::sin(1.0));
    EXPECT_DOUBLE_EQ(eval("cos(x)", 1.0), std::cos(1.0));
    EXPECT_DOUBLE_EQ(eval("tan(x)", 1.0), std::tan(1.0));
    EXPECT_DOUBLE_EQ(eval("exp(x)", 1.0), std::exp(1.0));
    EXPECT_DOUBLE_EQ(eval("ln(x)", 2.0), std::log(2.0));
    EXPECT_DOUBLE_EQ(eval("sqrt(x)", 9.0), 3.0);
    EXPECT_DOUBLE_EQ(eval("abs(x)", -4.0), 4.0);
    EXPECT_DOUBLE_EQ(eval("sin(x)*exp(-x^2)", 0.5), std::sin(0.5) * std::exp(-0.25));
}

TEST(EvaluatorTest, NegativeBaseWithIntegerExponentIsAllowed) {
    EXPECT_DOUBLE_EQ(eval("x^3", -2.0), -8.0);
    EXPECT_DOUBLE_EQ(eval("x^2", -2.0), 4.0);
}

TEST(EvaluatorTest, DomainErrors) {
    EXPECT_EQ(failureOf("sqrt(-1)"), DomainErrorKind::SqrtDomain);
    EXPECT_EQ(failureOf("ln(0)"), DomainErrorKind::LogDomain);
    EXPECT_EQ(failureOf("ln(-3)"), DomainErrorKind::LogDomain);
    EXPECT_EQ(failureOf("1/0"), DomainErrorKind::DivByZero);
    EXPECT_EQ(failureOf("0/0"), DomainErrorKind::DivByZero);
    EXPECT_EQ(failureOf("1/x", 0.0), DomainErrorKind::DivByZero);
    EXPECT_EQ(failureOf("x^0.5", -4.0), DomainErrorKind::InvalidPow);
}

TEST(EvaluatorTest, NonFiniteResultsBecomeDomainErrors) {
    EXPECT_EQ(failureOf("exp(1000)"), DomainErrorKind::NonFinite);
    EXPECT_EQ(failureOf("1e308 * 10"), DomainErrorKind::NonFinite);
    EXPECT_EQ(failureOf("0^-1"), DomainErrorKind::NonFinite);
    EXPECT_EQ(failureOf("x", std::numeric_limits<double>::quiet_NaN()), DomainErrorKind::NonFinite);
}

TEST(EvaluatorTest, FailureDoesNotContaminateLaterCalls) {
    auto expression = Expression::compile("1/x");
    EXPECT_THROW(expression.evaluate({{"x", 0.0}}), DomainError);
    EXPECT_DOUBLE_EQ(expression.evaluate({{"x", 2.0}}), 0.5);
}

TEST(EvaluatorTest, MissingBindingIsContractViolation) {
    auto expression = Expression::compile("x + 1");
    EXPECT_THROW(expression.evaluate({}), std::logic_error);
    EXPECT_THROW(expression.evaluate({{"t", 1.0}}), std::logic_error);
}

TEST(EvaluatorTest, EvaluatesValidatedTreeDirectly) {
    auto expression = Expression::compile("x * x");
    EXPECT_DOUBLE_EQ(evaluate(expression.tree(), {{"x", 3.0}}), 9.0);
}

TEST(EvaluatorTest, DomainErrorKindNames) {
    EXPECT_STREQ(toString(DomainErrorKind::DivByZero), "DivByZero");
    EXPECT_STREQ(toString(DomainErrorKind::InvalidPow), "InvalidPow");
    EXPECT_STREQ(toString(DomainErrorKind::LogDomain), "LogDomain");
    EXPECT_STREQ(toString(DomainErrorKind::SqrtDomain), "SqrtDomain");
    EXPECT_STREQ(toString(DomainErrorKind::NonFinite), "NonFinite");
}
