#pragma once

#include <set>
#include <string>

#include "ast.hpp"
#include "symbol_registry.hpp"

namespace grapher {

class ValidatedAst;

// Проверяет дерево по реестру и связывает вызовы с записями реестра.
// Забирает дерево во владение.
// Выбрасывает UnknownIdentifier или ArityMismatch для первого
// (при обходе сверху вниз, слева направо) некорректного узла.
ValidatedAst validate(NodePtr ast, const SymbolRegistry& registry);

// Проверенное дерево: все имена известны реестру, все вызовы связаны
// с правилами вычисления и имеют правильное число аргументов.
// Создаётся только функцией validate().
class ValidatedAst {
public:
    const Node& root() const { return *rootNode; }

    // Имена переменных, от которых зависит выражение
    const std::set<std::string>& freeVariables() const { return variables; }

private:
    ValidatedAst(NodePtr root, std::set<std::string> freeVariables)
        : rootNode(std::move(root)), variables(std::move(freeVariables)) {}

    friend ValidatedAst validate(NodePtr ast, const SymbolRegistry& registry);

    NodePtr rootNode;
    std::set<std::string> variables;
};

} // namespace grapher
