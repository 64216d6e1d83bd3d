#include "expression.hpp"

#include "parser.hpp"
#include "tokenizer.hpp"

namespace grapher {

Expression::Expression(std::string text, ValidatedAst validated)
    : source(std::move(text)), ast(std::move(validated)) {}

// Полный цикл компиляции:
// 1. Токенизация (Tokenizer)
// 2. Парсинг (Parser) -> построение AST
// 3. Проверка имён и арности (validate) -> связанное дерево
Expression Expression::compile(const std::string& text, const SymbolRegistry& registry) {
    // Этап 1: Лексический анализ
    Tokenizer tokenizer(text);
    auto tokens = tokenizer.tokenize();

    // Этап 2: Синтаксический анализ
    Parser parser(std::move(tokens));
    auto root = parser.parse();

    // Этап 3: Связывание с реестром
    return Expression(text, validate(std::move(root), registry));
}

double Expression::evaluate(const Bindings& bindings) const {
    return grapher::evaluate(ast, bindings);
}

std::string Expression::toString() const {
    return formatNode(ast.root());
}

} // namespace grapher
