#pragma once

#include <cstddef>
#include <string>

namespace grapher {

// Типы лексем, которые выделяет токенизатор
enum class TokenType {
    Number,     // Числовой литерал: 3, 1.5, 2e-3
    Identifier, // Имя переменной или функции
    Operator,   // + - * / ^
    LeftParen,  // (
    RightParen, // )
    Comma,      // Разделитель аргументов функции
    End         // Конец входной строки
};

// Лексема. Неизменяема после создания.
struct Token {
    TokenType type;
    double numericValue = 0.0; // Значение (только для Number)
    std::string text;          // Исходный текст лексемы
    std::size_t position = 0;  // Позиция первого символа в исходной строке

    bool isOperator(char op) const {
        return type == TokenType::Operator && text.size() == 1 && text[0] == op;
    }
};

// Человекочитаемое описание лексемы для сообщений об ошибках
std::string describeToken(const Token& token);

} // namespace grapher
