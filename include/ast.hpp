#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace grapher {

struct FunctionInfo;
struct Node;

// Узел владеет своими потомками единолично
using NodePtr = std::unique_ptr<Node>;

// Числовая константа (лист дерева)
struct Constant {
    double value;
};

// Ссылка на переменную, например x
struct Variable {
    std::string name;
};

// Унарная операция: '-' или '+'
struct UnaryOp {
    char op;
    NodePtr operand;
};

// Бинарная операция: '+', '-', '*', '/', '^'
struct BinaryOp {
    char op;
    NodePtr left;
    NodePtr right;
};

// Вызов функции. Поле function заполняет валидатор:
// после проверки оно указывает на запись реестра с правилом вычисления.
struct Call {
    std::string name;
    std::vector<NodePtr> args;
    const FunctionInfo* function = nullptr;
};

// Узел абстрактного синтаксического дерева (AST).
// Размеченное объединение вариантов; обход через std::visit
// не скомпилируется, если какой-то вариант не обработан.
struct Node {
    std::variant<Constant, Variable, UnaryOp, BinaryOp, Call> value;
    std::size_t position = 0; // Позиция лексемы, породившей узел
    std::size_t height = 1;   // Высота поддерева, у листа 1
};

// Набор перегрузок для std::visit
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

NodePtr makeConstant(double value, std::size_t position);
NodePtr makeVariable(std::string name, std::size_t position);
NodePtr makeUnary(char op, NodePtr operand, std::size_t position);
NodePtr makeBinary(char op, NodePtr left, NodePtr right, std::size_t position);
NodePtr makeCall(std::string name, std::vector<NodePtr> args, std::size_t position);

// Текстовое представление дерева с полной расстановкой скобок:
// "1+2*3" -> "(1 + (2 * 3))"
std::string formatNode(const Node& node);

} // namespace grapher
