#pragma once

#include <string>
#include <unordered_map>

#include "validator.hpp"

namespace grapher {

// Значения переменных для одного вычисления: имя -> число
using Bindings = std::unordered_map<std::string, double>;

// Рекурсивно вычисляет значение проверенного дерева.
//
// Возвращает конечное число или бросает DomainError:
//   деление на точный ноль       -> DivByZero
//   (-a)^b для нецелого b        -> InvalidPow
//   ln(a), a <= 0                -> LogDomain
//   sqrt(a), a < 0               -> SqrtDomain
//   бесконечность или NaN после любой операции -> NonFinite
//
// Отсутствие нужной переменной в bindings считается ошибкой вызывающего кода
// (std::logic_error), а не пользователя.
double evaluate(const ValidatedAst& ast, const Bindings& bindings);

} // namespace grapher
