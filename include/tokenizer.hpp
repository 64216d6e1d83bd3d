#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace grapher {

// Класс лексического анализатора (лексера)
// Преобразует строку с определением функции в последовательность токенов.
// Работает лениво: next() выделяет по одной лексеме за вызов.
// Унарный минус здесь не распознаётся, это задача парсера.
class Tokenizer {
public:
    // Конструктор принимает исходную строку выражения
    explicit Tokenizer(std::string sourceText);

    // Возвращает следующую лексему.
    // После конца строки каждый вызов возвращает токен End.
    // Выбрасывает LexError при обнаружении недопустимого символа.
    Token next();

    // Возвращает чтение в начало строки
    void reset();

    // Токенизирует всю строку с начала.
    // Возвращает вектор токенов, заканчивающийся токеном End.
    std::vector<Token> tokenize();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    bool isAtEnd() const;
    char peek() const;

    // Символ через offset позиций от текущей или '\0' за концом строки
    char peekAhead(std::size_t offset) const;

    char advance();

    // Пропускает пробелы, табуляции и переводы строк
    void skipWhitespace();

    // Считывает число: 12, 1.5, .5, 1.5e-3
    Token makeNumber();

    // Считывает идентификатор: [A-Za-z_][A-Za-z0-9_]*
    Token makeIdentifier();

    Token makeSingle(TokenType type);
};

// Токенизирует строку целиком
std::vector<Token> tokenize(const std::string& text);

} // namespace grapher
