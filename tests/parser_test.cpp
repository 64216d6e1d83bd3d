#include "parser.hpp"

#include "errors.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace grapher;

namespace {
std::string parsed(const std::string& text) {
    return formatNode(*parse(text));
}

SyntaxError syntaxErrorOf(const std::string& text) {
    try {
        parse(text);
    }
    catch (const SyntaxError& error) {
        return error;
    }
    throw std::runtime_error("SyntaxError expected for: " + text);
}
}

TEST(ParserTest, MultiplicationBindsTighterThanAddition) {
    EXPECT_EQ(parsed("1+2*3"), "(1 + (2 * 3))");
    EXPECT_EQ(parsed("(1+2)*3"), "((1 + 2) * 3)");
}

TEST(ParserTest, AdditiveAndMultiplicativeOperatorsAreLeftAssociative) {
    EXPECT_EQ(parsed("1-2-3"), "((1 - 2) - 3)");
    EXPECT_EQ(parsed("8/4/2"), "((8 / 4) / 2)");
}

TEST(ParserTest, ExponentiationIsRightAssociative) {
    EXPECT_EQ(parsed("2^3^2"), "(2 ^ (3 ^ 2))");
}

TEST(ParserTest, UnaryMinusIsLowerThanExponentiation) {
    EXPECT_EQ(parsed("-x^2"), "(-(x ^ 2))");
    EXPECT_EQ(parsed("2^-1"), "(2 ^ (-1))");
    EXPECT_EQ(parsed("2*-x"), "(2 * (-x))");
    EXPECT_EQ(parsed("-(-x)"), "(-(-x))");
    EXPECT_EQ(parsed("+x"), "(+x)");
}

TEST(ParserTest, FunctionCallsKeepArgumentOrder) {
    EXPECT_EQ(parsed("sin(x)*exp(-x^2)"), "(sin(x) * exp((-(x ^ 2))))");
    EXPECT_EQ(parsed("f(1, x, 2)"), "f(1, x, 2)");
    EXPECT_EQ(parsed("f()"), "f()");
}

TEST(ParserTest, NodesCarrySourcePositions) {
    auto root = parse("x + sin(1)");
    const auto& binary = std::get<BinaryOp>(root->value);

    EXPECT_EQ(root->position, 2u);
    EXPECT_EQ(binary.left->position, 0u);
    EXPECT_EQ(binary.right->position, 4u);
    EXPECT_EQ(std::get<Call>(binary.right->value).name, "sin");
}

TEST(ParserTest, UnmatchedOpeningParenthesis) {
    auto error = syntaxErrorOf("sin(x");
    EXPECT_EQ(error.position(), 5u);
    EXPECT_EQ(error.found(), "конец выражения");

    EXPECT_THROW(parse("2^((2)"), SyntaxError);
}

TEST(ParserTest, UnmatchedClosingParenthesis) {
    auto error = syntaxErrorOf("(3 + 2))^2");
    EXPECT_EQ(error.position(), 7u);
    EXPECT_EQ(error.expected(), "конец выражения");
}

TEST(ParserTest, EmptyExpression) {
    auto error = syntaxErrorOf("   ");
    EXPECT_EQ(error.expected(), "выражение");

    EXPECT_THROW(parse(""), SyntaxError);
    EXPECT_THROW(parse("()"), SyntaxError);
}

TEST(ParserTest, MissingOperand) {
    EXPECT_THROW(parse("3 + "), SyntaxError);
    EXPECT_EQ(syntaxErrorOf("*2").position(), 0u);
}

TEST(ParserTest, TrailingTokensAreRejected) {
    EXPECT_EQ(syntaxErrorOf("2x").position(), 1u);
    EXPECT_THROW(parse("x y"), SyntaxError);
}

TEST(ParserTest, MissingArgumentsAreStructuralErrors) {
    EXPECT_THROW(parse("sin(x,)"), SyntaxError);
    EXPECT_THROW(parse("sin(,x)"), SyntaxError);
}

TEST(ParserTest, LexErrorsPropagateFromTokenizer) {
    EXPECT_THROW(parse("x & 1"), LexError);
}

TEST(ParserTest, RequiresEndTerminatedTokens) {
    EXPECT_THROW(Parser(std::vector<Token>{}), std::invalid_argument);
}

TEST(ParserTest, NodesKnowSubtreeHeight) {
    EXPECT_EQ(parse("x")->height, 1u);
    EXPECT_EQ(parse("1+2*3")->height, 3u);
    EXPECT_EQ(parse("sin(-x)")->height, 3u);
    EXPECT_EQ(parse("f()")->height, 1u);
}

TEST(ParserTest, DeepNestingIsRejectedWithoutCrash) {
    const std::size_t n = 100000;
    EXPECT_THROW(parse(std::string(n, '-') + "x"), SyntaxError);
    EXPECT_THROW(parse(std::string(n, '(') + "x" + std::string(n, ')')), SyntaxError);

    std::string calls;
    for (std::size_t i = 0; i < 10000; ++i) {
        calls += "sin(";
    }
    EXPECT_THROW(parse(calls + "x" + std::string(10000, ')')), SyntaxError);

    std::string powers = "2";
    for (std::size_t i = 0; i < 10000; ++i) {
        powers += "^2";
    }
    EXPECT_THROW(parse(powers), SyntaxError);
}

TEST(ParserTest, LongOperatorChainIsLimitedByTreeHeight) {
    std::string chain = "x";
    for (std::size_t i = 0; i < 50000; ++i) {
        chain += "+x";
    }
    EXPECT_THROW(parse(chain), SyntaxError);

    // Цепочки внутри скобок складывают высоту
    std::string nested = "x";
    for (std::size_t i = 0; i < 200; ++i) {
        nested = "(" + nested + "+x+x+x+x+x+x+x+x+x+x)";
    }
    EXPECT_THROW(parse(nested), SyntaxError);
}

TEST(ParserTest, NestingUpToLimitIsAccepted) {
    const std::size_t limit = Parser::kMaxDepth;
    auto root = parse(std::string(limit, '(') + "x" + std::string(limit, ')'));
    EXPECT_EQ(formatNode(*root), "x");
    EXPECT_THROW(parse(std::string(limit + 1, '(') + "x" + std::string(limit + 1, ')')), SyntaxError);

    auto negations = parse(std::string(limit - 1, '-') + "x");
    EXPECT_EQ(negations->height, limit);
    EXPECT_THROW(parse(std::string(limit, '-') + "x"), SyntaxError);

    std::string chain = "x";
    for (std::size_t i = 0; i + 1 < limit; ++i) {
        chain += "+x";
    }
    EXPECT_EQ(parse(chain)->height, limit);
    EXPECT_THROW(parse(chain + "+x"), SyntaxError);
}
