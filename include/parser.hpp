#pragma once

#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

namespace grapher {

// Класс синтаксического анализатора (парсера)
// Строит абстрактное синтаксическое дерево (AST) из списка токенов.
// Реализует алгоритм рекурсивного спуска.
//
// Приоритеты от низшего к высшему:
//   сложение/вычитание, умножение/деление, унарный минус,
//   возведение в степень (правоассоциативное), атомы.
// Поэтому -x^2 = -(x^2), 2^3^2 = 2^(3^2), 2^-1 = 2^(-1).
//
// Глубина рекурсии разбора ограничена kMaxDepth: уровень добавляют скобки,
// вызов функции, унарный знак и показатель степени. Высота построенного
// дерева тоже не превышает kMaxDepth (цепочка x+x+...+x растёт влево на
// уровень за оператор). Более глубокое выражение отклоняется с SyntaxError,
// так что рекурсивные обходы дерева не переполняют стек.
class Parser {
public:
    static constexpr std::size_t kMaxDepth = 256;

    // Список токенов должен заканчиваться токеном End (как у Tokenizer::tokenize)
    explicit Parser(std::vector<Token> tokens);

    // Возвращает корневой узел AST
    // Выбрасывает SyntaxError при синтаксических ошибках
    NodePtr parse();

private:
    const std::vector<Token> tokens; // Список токенов
    std::size_t current = 0;         // Индекс текущего токена
    std::size_t depth = 0;           // Текущая глубина вложенности

    // Возвращает текущий токен без продвижения
    const Token& peek() const;

    // Если текущий токен имеет тип type, сдвигает указатель и возвращает true
    bool match(TokenType type);

    // То же для оператора с конкретным символом
    bool matchOperator(char op);

    // Ожидает токен определённого типа, иначе SyntaxError с описанием expected
    const Token& consume(TokenType type, const std::string& expected);

    bool isAtEnd() const;

    // Ошибка "ожидалось expected" на текущем токене
    [[noreturn]] void fail(const std::string& expected) const;

    // Следующий уровень вложенности; SyntaxError при превышении kMaxDepth.
    // Вызывающий метод восстанавливает depth перед возвратом.
    void descend();

    // Пропускает узел, если высота его поддерева не больше kMaxDepth
    NodePtr limitHeight(NodePtr node) const;

    // --- Методы рекурсивного спуска (от низкого приоритета к высокому) ---

    // Expression -> Term { ("+" | "-") Term }
    NodePtr parseExpression();

    // Term -> Unary { ("*" | "/") Unary }
    NodePtr parseTerm();

    // Unary -> ("-" | "+") Unary | Power
    NodePtr parseUnary();

    // Power -> Primary [ "^" Unary ]
    NodePtr parsePower();

    // Primary -> Number | Identifier [ "(" Arguments ")" ] | "(" Expression ")"
    NodePtr parsePrimary();

    // Arguments -> [ Expression { "," Expression } ]
    NodePtr parseFunctionCall(const Token& name);
};

// Токенизация и разбор строки за один вызов
NodePtr parse(const std::string& text);

} // namespace grapher
