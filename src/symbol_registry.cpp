#include "symbol_registry.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace grapher {

namespace {
std::vector<FunctionInfo> standardFunctions() {
    return {
        {"sin", 1, [](std::span<const double> args) { return std::sin(args[0]); }, "синус"},
        {"cos", 1, [](std::span<const double> args) { return std::cos(args[0]); }, "косинус"},
        {"tan", 1, [](std::span<const double> args) { return std::tan(args[0]); }, "тангенс"},
        {"exp", 1, [](std::span<const double> args) { return std::exp(args[0]); }, "экспонента"},
        {"ln", 1,
         [](std::span<const double> args) {
             if (args[0] <= 0.0) {
                 throw DomainError(DomainErrorKind::LogDomain);
             }
             return std::log(args[0]);
         },
         "натуральный логарифм, аргумент > 0"},
        {"sqrt", 1,
         [](std::span<const double> args) {
             if (args[0] < 0.0) {
                 throw DomainError(DomainErrorKind::SqrtDomain);
             }
             return std::sqrt(args[0]);
         },
         "квадратный корень, аргумент >= 0"},
        {"abs", 1, [](std::span<const double> args) { return std::abs(args[0]); }, "модуль"},
    };
}
}

SymbolRegistry::SymbolRegistry(std::vector<FunctionInfo> functions,
                               std::map<std::string, VariableRole> variables)
    : functionTable(std::move(functions)), variableTable(std::move(variables)) {
    std::set<std::string> names;
    for (const auto& function : functionTable) {
        if (!function.rule) {
            throw std::invalid_argument("Для функции '" + function.name +
                                        "' не задано правило вычисления");
        }
        if (!names.insert(function.name).second) {
            throw std::invalid_argument("Функция '" + function.name + "' объявлена дважды");
        }
    }
    for (const auto& [name, role] : variableTable) {
        if (names.contains(name)) {
            throw std::invalid_argument("Имя '" + name + "' занято функцией");
        }
    }
}

const SymbolRegistry& SymbolRegistry::standard() {
    static const SymbolRegistry registry(standardFunctions(), {{"x", VariableRole::Independent}});
    return registry;
}

const FunctionInfo* SymbolRegistry::findFunction(const std::string& name) const {
    auto it = std::find_if(functionTable.begin(), functionTable.end(),
                           [&name](const FunctionInfo& info) { return info.name == name; });
    return it != functionTable.end() ? &*it : nullptr;
}

std::optional<VariableRole> SymbolRegistry::findVariable(const std::string& name) const {
    auto it = variableTable.find(name);
    if (it == variableTable.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace grapher
