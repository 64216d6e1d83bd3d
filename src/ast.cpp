#include "ast.hpp"

#include <algorithm>
#include <cstdio>

namespace grapher {

NodePtr makeConstant(double value, std::size_t position) {
    return std::make_unique<Node>(Node{Constant{value}, position});
}

NodePtr makeVariable(std::string name, std::size_t position) {
    return std::make_unique<Node>(Node{Variable{std::move(name)}, position});
}

NodePtr makeUnary(char op, NodePtr operand, std::size_t position) {
    std::size_t height = operand->height + 1;
    return std::make_unique<Node>(Node{UnaryOp{op, std::move(operand)}, position, height});
}

NodePtr makeBinary(char op, NodePtr left, NodePtr right, std::size_t position) {
    std::size_t height = std::max(left->height, right->height) + 1;
    return std::make_unique<Node>(
        Node{BinaryOp{op, std::move(left), std::move(right)}, position, height});
}

NodePtr makeCall(std::string name, std::vector<NodePtr> args, std::size_t position) {
    std::size_t height = 1;
    for (const auto& arg : args) {
        height = std::max(height, arg->height + 1);
    }
    return std::make_unique<Node>(
        Node{Call{std::move(name), std::move(args), nullptr}, position, height});
}

std::string formatNode(const Node& node) {
    return std::visit(
        Overloaded{
            [](const Constant& constant) {
                char buffer[32];
                std::snprintf(buffer, sizeof(buffer), "%g", constant.value);
                return std::string(buffer);
            },
            [](const Variable& variable) { return variable.name; },
            [](const UnaryOp& unary) {
                return "(" + std::string(1, unary.op) + formatNode(*unary.operand) + ")";
            },
            [](const BinaryOp& binary) {
                return "(" + formatNode(*binary.left) + " " + std::string(1, binary.op) + " " +
                       formatNode(*binary.right) + ")";
            },
            [](const Call& call) {
                std::string result = call.name + "(";
                for (std::size_t i = 0; i < call.args.size(); ++i) {
                    if (i > 0) {
                        result.append(", ");
                    }
                    result.append(formatNode(*call.args[i]));
                }
                result.push_back(')');
                return result;
            },
        },
        node.value);
}

} // namespace grapher
