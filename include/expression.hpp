#pragma once

#include <set>
#include <string>

#include "evaluator.hpp"
#include "symbol_registry.hpp"
#include "validator.hpp"

namespace grapher {

// Скомпилированная функция пользователя.
// Объединяет этапы токенизации, парсинга и проверки по реестру.
// Неизменяема; вычисляется сколько угодно раз с разными значениями переменных.
// При изменении текста создаётся новое выражение, старое просто уничтожается.
class Expression {
public:
    // Компилирует строку, например "sin(x)*exp(-x^2)".
    // Выбрасывает LexError, SyntaxError, UnknownIdentifier или ArityMismatch;
    // частично построенное выражение наружу не попадает.
    static Expression compile(const std::string& text,
                              const SymbolRegistry& registry = SymbolRegistry::standard());

    Expression(Expression&&) = default;
    Expression& operator=(Expression&&) = default;

    double evaluate(const Bindings& bindings) const;

    // Копия исходного текста
    const std::string& text() const { return source; }

    const std::set<std::string>& freeVariables() const { return ast.freeVariables(); }

    const ValidatedAst& tree() const { return ast; }

    // Дерево с полной расстановкой скобок
    std::string toString() const;

private:
    Expression(std::string text, ValidatedAst validated);

    std::string source;
    ValidatedAst ast;
};

} // namespace grapher
