#include "sampler.hpp"

#include "errors.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <limits>

using namespace grapher;

namespace {
// Счётчик вызовов функции tally(x) = x
std::atomic<int> tallyCalls{0};

const SymbolRegistry& tallyRegistry() {
    static const SymbolRegistry registry(
        {{"tally", 1,
          [](std::span<const double> args) {
              ++tallyCalls;
              return args[0];
          },
          "возвращает аргумент и считает вызовы"}},
        {{"x", VariableRole::Independent}, {"t", VariableRole::Independent}});
    return registry;
}
}

TEST(SamplerTest, SquareOnSymmetricRange) {
    auto expression = Expression::compile("x^2");
    auto points = sample(expression, "x", -1.0, 1.0, 3);

    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(points[0].x, -1.0);
    EXPECT_EQ(points[1].x, 0.0);
    EXPECT_EQ(points[2].x, 1.0);
    for (const auto& point : points) {
        ASSERT_TRUE(point.defined());
        EXPECT_FALSE(point.failure.has_value());
    }
    EXPECT_EQ(*points[0].y, 1.0);
    EXPECT_EQ(*points[1].y, 0.0);
    EXPECT_EQ(*points[2].y, 1.0);
}

TEST(SamplerTest, UndefinedPointDoesNotDiscardCurve) {
    auto expression = Expression::compile("1/x");
    auto points = sample(expression, "x", -1.0, 1.0, 3);

    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(*points[0].y, -1.0);
    EXPECT_FALSE(points[1].defined());
    EXPECT_EQ(points[1].x, 0.0);
    EXPECT_EQ(points[1].failure, DomainErrorKind::DivByZero);
    EXPECT_EQ(*points[2].y, 1.0);
}

TEST(SamplerTest, EndpointsAreIncludedExactly) {
    auto expression = Expression::compile("x");
    auto points = sample(expression, "x", 0.0, 10.0, 501);

    ASSERT_EQ(points.size(), 501u);
    EXPECT_EQ(points.front().x, 0.0);
    EXPECT_EQ(points.back().x, 10.0);
    EXPECT_DOUBLE_EQ(points[250].x, 5.0);
    for (std::size_t i = 1; i < points.size(); ++i) {
        EXPECT_LT(points[i - 1].x, points[i].x);
    }
}

TEST(SamplerTest, ConstantExpressionNeedsNoVariable) {
    auto expression = Expression::compile("2 * 3");
    auto points = sample(expression, "x", 0.0, 1.0, 2);

    ASSERT_EQ(points.size(), 2u);
    EXPECT_EQ(*points[0].y, 6.0);
    EXPECT_EQ(*points[1].y, 6.0);
}

TEST(SamplerTest, InvalidArgumentsFailBeforeEvaluation) {
    auto expression = Expression::compile("tally(x)", tallyRegistry());
    tallyCalls = 0;

    EXPECT_THROW(sample(expression, "x", -1.0, 1.0, 1), InvalidCount);
    EXPECT_THROW(sample(expression, "x", -1.0, 1.0, 0), InvalidCount);
    EXPECT_THROW(sample(expression, "x", 1.0, 1.0, 10), InvalidRange);
    EXPECT_THROW(sample(expression, "x", 2.0, 1.0, 10), InvalidRange);
    EXPECT_THROW(sample(expression, "x", 0.0, std::numeric_limits<double>::infinity(), 10), InvalidRange);
    EXPECT_THROW(sample(expression, "x", std::nan(""), 1.0, 10), InvalidRange);
    EXPECT_EQ(tallyCalls.load(), 0);

    sample(expression, "x", 0.0, 1.0, 4);
    EXPECT_EQ(tallyCalls.load(), 4);
}

TEST(SamplerTest, ErrorsCarryOffendingValues) {
    auto expression = Expression::compile("x");
    try {
        sample(expression, "x", 3.0, 1.0, 10);
        FAIL() << "InvalidRange expected";
    }
    catch (const InvalidRange& error) {
        EXPECT_EQ(error.low(), 3.0);
        EXPECT_EQ(error.high(), 1.0);
    }
    try {
        sample(expression, "x", 0.0, 1.0, 1);
        FAIL() << "InvalidCount expected";
    }
    catch (const InvalidCount& error) {
        EXPECT_EQ(error.count(), 1u);
    }
}

TEST(SamplerTest, VariableOtherThanSampledOneIsRejected) {
    auto expression = Expression::compile("tally(x) + t", tallyRegistry());
    tallyCalls = 0;

    try {
        sample(expression, "x", 0.0, 1.0, 5);
        FAIL() << "UnboundVariable expected";
    }
    catch (const UnboundVariable& error) {
        EXPECT_EQ(error.name(), "t");
    }
    EXPECT_EQ(tallyCalls.load(), 0);
}

TEST(SamplerTest, SamplesAlongCustomVariable) {
    auto expression = Expression::compile("tally(t) * 2", tallyRegistry());
    auto points = sample(expression, "t", 0.0, 2.0, 3);

    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(*points[2].y, 4.0);
}

TEST(SamplerTest, RepeatedCallsAreIdentical) {
    auto expression = Expression::compile("sin(x)*exp(-x^2) + ln(x)");
    auto first = sample(expression, "x", -3.0, 3.0, 257);
    auto second = sample(expression, "x", -3.0, 3.0, 257);

    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].x, second[i].x);
        EXPECT_EQ(first[i].y, second[i].y);
        EXPECT_EQ(first[i].failure, second[i].failure);
    }
}

TEST(SamplerTest, LogarithmIsUndefinedOnNonPositiveHalf) {
    auto expression = Expression::compile("ln(x)");
    auto points = sample(expression, "x", -1.0, 1.0, 5);

    EXPECT_EQ(points[0].failure, DomainErrorKind::LogDomain);
    EXPECT_EQ(points[1].failure, DomainErrorKind::LogDomain);
    EXPECT_EQ(points[2].failure, DomainErrorKind::LogDomain);
    EXPECT_TRUE(points[3].defined());
    EXPECT_DOUBLE_EQ(*points[4].y, 0.0);
}

TEST(SplitSegmentsTest, BreaksCurveAtUndefinedPoints) {
    auto expression = Expression::compile("1/x");
    auto segments = splitSegments(sample(expression, "x", -2.0, 2.0, 5));

    ASSERT_EQ(segments.size(), 2u);
    ASSERT_EQ(segments[0].size(), 2u);
    ASSERT_EQ(segments[1].size(), 2u);
    EXPECT_EQ(segments[0].back().x, -1.0);
    EXPECT_EQ(segments[1].front().x, 1.0);
}

TEST(SplitSegmentsTest, FullyUndefinedCurveHasNoSegments) {
    auto expression = Expression::compile("sqrt(x)");
    EXPECT_TRUE(splitSegments(sample(expression, "x", -2.0, -1.0, 5)).empty());
}

TEST(SamplerTest, RangeWiderThanDoubleStaysFinite) {
    auto expression = Expression::compile("x");
    auto points = sample(expression, "x", -1.5e308, 1.5e308, 3);

    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(points[0].x, -1.5e308);
    EXPECT_EQ(points[1].x, 0.0);
    EXPECT_EQ(points[2].x, 1.5e308);
    for (const auto& point : points) {
        EXPECT_TRUE(point.defined()) << point.x;
    }

    auto dense = sample(expression, "x", -std::numeric_limits<double>::max(),
                        std::numeric_limits<double>::max(), 101);
    for (std::size_t i = 0; i < dense.size(); ++i) {
        EXPECT_TRUE(std::isfinite(dense[i].x)) << i;
        if (i > 0) {
            EXPECT_LT(dense[i - 1].x, dense[i].x) << i;
        }
    }
}
