#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace grapher {

// Правило вычисления функции. Получает уже вычисленные аргументы
// (их ровно столько, сколько указано в арности) и либо возвращает значение,
// либо бросает DomainError.
using FunctionRule = std::function<double(std::span<const double>)>;

struct FunctionInfo {
    std::string name;
    std::size_t arity;
    FunctionRule rule;
    std::string description;
};

// Роль переменной в выражении
enum class VariableRole {
    Independent // Независимая переменная графика (ось абсцисс)
};

// Таблица допустимых имён: функции с арностью и правилом вычисления,
// переменные с их ролью. После создания не изменяется.
//
// Стандартный реестр (SymbolRegistry::standard()):
//   переменные: x
//   функции:    sin, cos, tan, exp, ln, sqrt, abs (все от одного аргумента)
//
// Выражения хранят указатели на записи реестра, поэтому реестр должен
// жить дольше всех скомпилированных с ним выражений.
class SymbolRegistry {
public:
    // Выбрасывает std::invalid_argument при повторяющихся именах
    // или пустом правиле вычисления
    SymbolRegistry(std::vector<FunctionInfo> functions, std::map<std::string, VariableRole> variables);

    SymbolRegistry(const SymbolRegistry&) = delete;
    SymbolRegistry& operator=(const SymbolRegistry&) = delete;

    // Стандартный реестр. Строится один раз при первом обращении.
    static const SymbolRegistry& standard();

    // nullptr, если функции с таким именем нет
    const FunctionInfo* findFunction(const std::string& name) const;

    std::optional<VariableRole> findVariable(const std::string& name) const;

    const std::vector<FunctionInfo>& functions() const { return functionTable; }
    const std::map<std::string, VariableRole>& variables() const { return variableTable; }

private:
    const std::vector<FunctionInfo> functionTable;
    const std::map<std::string, VariableRole> variableTable;
};

} // namespace grapher
