#include "parser.hpp"

#include "errors.hpp"
#include "tokenizer.hpp"

#include <stdexcept>
#include <string>

namespace grapher {

Parser::Parser(std::vector<Token> tokens) : tokens(std::move(tokens)) {
    if (this->tokens.empty() || this->tokens.back().type != TokenType::End) {
        throw std::invalid_argument("Список токенов должен заканчиваться токеном End");
    }
}

// Запуск процесса парсинга
// Ожидает, что всё выражение будет полностью разобрано
NodePtr Parser::parse() {
    current = 0;
    depth = 0;
    if (isAtEnd()) {
        fail("выражение");
    }
    auto root = parseExpression();
    if (!isAtEnd()) {
        // Сюда попадают лишняя ')' и неявное умножение вида 2x
        fail("конец выражения");
    }
    return root;
}

const Token& Parser::peek() const {
    return tokens[current];
}

bool Parser::match(TokenType type) {
    if (!isAtEnd() && tokens[current].type == type) {
        ++current;
        return true;
    }
    return false;
}

bool Parser::matchOperator(char op) {
    if (tokens[current].isOperator(op)) {
        ++current;
        return true;
    }
    return false;
}

const Token& Parser::consume(TokenType type, const std::string& expected) {
    if (match(type)) {
        return tokens[current - 1];
    }
    fail(expected);
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::End;
}

void Parser::fail(const std::string& expected) const {
    throw SyntaxError(peek().position, expected, describeToken(peek()));
}

void Parser::descend() {
    if (++depth > kMaxDepth) {
        fail("не более " + std::to_string(kMaxDepth) + " уровней вложенности");
    }
}

NodePtr Parser::limitHeight(NodePtr node) const {
    if (node->height > kMaxDepth) {
        throw SyntaxError(node->position,
                          "выражение высотой не более " + std::to_string(kMaxDepth),
                          "высота " + std::to_string(node->height));
    }
    return node;
}

NodePtr Parser::parseExpression() {
    auto node = parseTerm();
    while (true) {
        std::size_t position = peek().position;
        if (matchOperator('+')) {
            node = limitHeight(makeBinary('+', std::move(node), parseTerm(), position));
        } else if (matchOperator('-')) {
            node = limitHeight(makeBinary('-', std::move(node), parseTerm(), position));
        } else {
            break;
        }
    }
    return node;
}

NodePtr Parser::parseTerm() {
    auto node = parseUnary();
    while (true) {
        std::size_t position = peek().position;
        if (matchOperator('*')) {
            node = limitHeight(makeBinary('*', std::move(node), parseUnary(), position));
        } else if (matchOperator('/')) {
            node = limitHeight(makeBinary('/', std::move(node), parseUnary(), position));
        } else {
            break;
        }
    }
    return node;
}

NodePtr Parser::parseUnary() {
    std::size_t position = peek().position;
    char op = 0;
    if (matchOperator('-')) {
        op = '-';
    } else if (matchOperator('+')) {
        op = '+';
    } else {
        return parsePower();
    }

    descend();
    auto operand = parseUnary();
    --depth;
    return limitHeight(makeUnary(op, std::move(operand), position));
}

// Правая ассоциативность: показатель разбирается как Unary,
// который сам может снова содержать степень
NodePtr Parser::parsePower() {
    auto base = parsePrimary();
    std::size_t position = peek().position;
    if (matchOperator('^')) {
        descend();
        auto exponent = parseUnary();
        --depth;
        return limitHeight(makeBinary('^', std::move(base), std::move(exponent), position));
    }
    return base;
}

NodePtr Parser::parsePrimary() {
    // Число
    if (match(TokenType::Number)) {
        const auto& token = tokens[current - 1];
        return makeConstant(token.numericValue, token.position);
    }

    // Переменная или вызов функции
    if (match(TokenType::Identifier)) {
        const auto& token = tokens[current - 1];
        if (peek().type == TokenType::LeftParen) {
            return parseFunctionCall(token);
        }
        return makeVariable(token.text, token.position);
    }

    // Группировка скобками
    if (match(TokenType::LeftParen)) {
        descend();
        auto node = parseExpression();
        consume(TokenType::RightParen, "')'");
        --depth;
        return node;
    }

    fail("число, имя или '('");
}

// Разбор вызова функции, например: sin(x)
// Число аргументов проверяет валидатор по реестру
NodePtr Parser::parseFunctionCall(const Token& name) {
    consume(TokenType::LeftParen, "'('");
    descend();
    std::vector<NodePtr> args;
    if (!match(TokenType::RightParen)) {
        do {
            args.push_back(parseExpression());
        } while (match(TokenType::Comma));
        consume(TokenType::RightParen, "',' или ')'");
    }
    --depth;
    return limitHeight(makeCall(name.text, std::move(args), name.position));
}

NodePtr parse(const std::string& text) {
    Parser parser(tokenize(text));
    return parser.parse();
}

} // namespace grapher
