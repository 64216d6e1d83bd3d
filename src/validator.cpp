#include "validator.hpp"

#include "errors.hpp"

#include <stdexcept>

namespace grapher {

namespace {
// Рекурсивный обход: проверка имён, связывание вызовов, сбор переменных
void bindNode(Node& node, const SymbolRegistry& registry, std::set<std::string>& variables) {
    std::visit(Overloaded{
                   [](Constant&) {},
                   [&](Variable& variable) {
                       if (!registry.findVariable(variable.name)) {
                           throw UnknownIdentifier(variable.name, node.position);
                       }
                       variables.insert(variable.name);
                   },
                   [&](UnaryOp& unary) { bindNode(*unary.operand, registry, variables); },
                   [&](BinaryOp& binary) {
                       bindNode(*binary.left, registry, variables);
                       bindNode(*binary.right, registry, variables);
                   },
                   [&](Call& call) {
                       const FunctionInfo* function = registry.findFunction(call.name);
                       if (function == nullptr) {
                           throw UnknownIdentifier(call.name, node.position);
                       }
                       if (call.args.size() != function->arity) {
                           throw ArityMismatch(call.name, function->arity, call.args.size(),
                                               node.position);
                       }
                       call.function = function;
                       for (auto& arg : call.args) {
                           bindNode(*arg, registry, variables);
                       }
                   },
               },
               node.value);
}
}

ValidatedAst validate(NodePtr ast, const SymbolRegistry& registry) {
    if (!ast) {
        throw std::invalid_argument("Пустое дерево выражения");
    }
    std::set<std::string> variables;
    bindNode(*ast, registry, variables);
    return ValidatedAst(std::move(ast), std::move(variables));
}

} // namespace grapher
