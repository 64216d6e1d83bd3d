#include "evaluator.hpp"

#include "errors.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

namespace grapher {

namespace {
// Ни одно бесконечное или NaN значение не уходит дальше операции, где появилось
double checked(double value) {
    if (!std::isfinite(value)) {
        throw DomainError(DomainErrorKind::NonFinite);
    }
    return value;
}

double applyBinary(char op, double left, double right) {
    switch (op) {
    case '+':
        return checked(left + right);
    case '-':
        return checked(left - right);
    case '*':
        return checked(left * right);
    case '/':
        if (right == 0.0) {
            throw DomainError(DomainErrorKind::DivByZero);
        }
        return checked(left / right);
    case '^':
        if (left < 0.0 && std::trunc(right) != right) {
            throw DomainError(DomainErrorKind::InvalidPow);
        }
        return checked(std::pow(left, right));
    default:
        throw std::logic_error("Неизвестная бинарная операция: " + std::string(1, op));
    }
}

double evaluateNode(const Node& node, const Bindings& bindings) {
    return std::visit(
        Overloaded{
            [](const Constant& constant) { return constant.value; },
            [&](const Variable& variable) {
                auto it = bindings.find(variable.name);
                if (it == bindings.end()) {
                    throw std::logic_error("Не задано значение переменной '" + variable.name + "'");
                }
                return checked(it->second);
            },
            [&](const UnaryOp& unary) {
                double operand = evaluateNode(*unary.operand, bindings);
                switch (unary.op) {
                case '+':
                    return operand;
                case '-':
                    return -operand;
                default:
                    throw std::logic_error("Неизвестная унарная операция: " +
                                           std::string(1, unary.op));
                }
            },
            [&](const BinaryOp& binary) {
                double left = evaluateNode(*binary.left, bindings);
                double right = evaluateNode(*binary.right, bindings);
                return applyBinary(binary.op, left, right);
            },
            [&](const Call& call) {
                if (call.function == nullptr) {
                    throw std::logic_error("Вызов '" + call.name + "' не связан с реестром");
                }
                std::vector<double> args;
                args.reserve(call.args.size());
                for (const auto& arg : call.args) {
                    args.push_back(evaluateNode(*arg, bindings));
                }
                return checked(call.function->rule(args));
            },
        },
        node.value);
}
}

double evaluate(const ValidatedAst& ast, const Bindings& bindings) {
    return evaluateNode(ast.root(), bindings);
}

} // namespace grapher
