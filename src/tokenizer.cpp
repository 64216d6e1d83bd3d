#include "tokenizer.hpp"

#include "errors.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace grapher {

namespace {
bool isDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool isIdentifierStart(char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool isIdentifierChar(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}
}

std::string describeToken(const Token& token) {
    switch (token.type) {
    case TokenType::Number:
        return "число '" + token.text + "'";
    case TokenType::Identifier:
        return "идентификатор '" + token.text + "'";
    case TokenType::Operator:
    case TokenType::LeftParen:
    case TokenType::RightParen:
    case TokenType::Comma:
        return "'" + token.text + "'";
    case TokenType::End:
        return "конец выражения";
    }
    return "'" + token.text + "'";
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Выделяет одну лексему, начиная с текущей позиции
Token Tokenizer::next() {
    skipWhitespace();
    if (isAtEnd()) {
        return {TokenType::End, 0.0, "", source.size()};
    }

    char ch = peek();
    switch (ch) {
    // Односимвольные токены
    case '+':
    case '-':
    case '*':
    case '/':
    case '^':
        return makeSingle(TokenType::Operator);
    case '(':
        return makeSingle(TokenType::LeftParen);
    case ')':
        return makeSingle(TokenType::RightParen);
    case ',':
        return makeSingle(TokenType::Comma);
    default:
        // Многосимвольные токены (числа и идентификаторы)
        if (isDigit(ch) || ch == '.') {
            return makeNumber();
        }
        if (isIdentifierStart(ch)) {
            return makeIdentifier();
        }
        throw LexError(index, ch);
    }
}

void Tokenizer::reset() {
    index = 0;
}

// Основной цикл разбора: проходит по строке с начала и собирает все токены
std::vector<Token> Tokenizer::tokenize() {
    reset();
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next());
        if (tokens.back().type == TokenType::End) {
            break;
        }
    }
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::peekAhead(std::size_t offset) const {
    return index + offset < source.size() ? source[index + offset] : '\0';
}

char Tokenizer::advance() {
    return source[index++];
}

// Пропуск всех незначащих символов
void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

Token Tokenizer::makeSingle(TokenType type) {
    std::size_t start = index;
    return {type, 0.0, std::string(1, advance()), start};
}

// Разбор числового литерала
// Целая часть, необязательная дробная часть и необязательный порядок
Token Tokenizer::makeNumber() {
    std::size_t start = index;
    bool hasDigits = false;

    while (!isAtEnd() && isDigit(peek())) {
        advance();
        hasDigits = true;
    }
    if (!isAtEnd() && peek() == '.') {
        advance();
        while (!isAtEnd() && isDigit(peek())) {
            advance();
            hasDigits = true;
        }
    }
    if (!hasDigits) {
        // Одиночная точка не является числом
        throw LexError(start, source[start]);
    }

    // Порядок забираем только если за 'e' и знаком действительно идут цифры,
    // иначе 'e' начинает идентификатор
    if (!isAtEnd() && (peek() == 'e' || peek() == 'E')) {
        std::size_t offset = 1;
        if (peekAhead(offset) == '+' || peekAhead(offset) == '-') {
            ++offset;
        }
        if (isDigit(peekAhead(offset))) {
            index += offset;
            while (!isAtEnd() && isDigit(peek())) {
                advance();
            }
        }
    }

    std::string text = source.substr(start, index - start);
    errno = 0;
    double value = std::strtod(text.c_str(), nullptr);
    if (errno == ERANGE && !std::isfinite(value)) {
        throw LexError(start, source[start],
                       "Число '" + text + "' в позиции " + std::to_string(start) +
                           " не помещается в double");
    }
    return {TokenType::Number, value, text, start};
}

// Разбор идентификатора (имя функции или переменной)
// Регистр символов сохраняется: Sin и sin различаются
Token Tokenizer::makeIdentifier() {
    std::size_t start = index;
    while (!isAtEnd() && isIdentifierChar(peek())) {
        advance();
    }
    return {TokenType::Identifier, 0.0, source.substr(start, index - start), start};
}

std::vector<Token> tokenize(const std::string& text) {
    Tokenizer tokenizer(text);
    return tokenizer.tokenize();
}

} // namespace grapher
