#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "expression.hpp"

namespace grapher {

// Точка графика. y пуст, если функция не определена в x;
// в этом случае failure хранит вид ошибки вычисления.
struct SamplePoint {
    double x;
    std::optional<double> y;
    std::optional<DomainErrorKind> failure;

    bool defined() const { return y.has_value(); }
};

// Вычисляет count равноотстоящих точек на отрезке [low, high] включительно:
// x_i = low * (1 - t) + high * t, t = i / (count - 1).
// Первая точка равна low, последняя равна high точно; все x_i конечны,
// даже если high - low переполняет double.
//
// Ошибка вычисления в точке делает неопределённой только эту точку.
// До первого вычисления проверяются аргументы:
//   count < 2                                 -> InvalidCount
//   low >= high или граница не конечна        -> InvalidRange
//   выражению нужна переменная кроме variable -> UnboundVariable
std::vector<SamplePoint> sample(const Expression& expression, const std::string& variable,
                                double low, double high, std::size_t count);

// Разбивает кривую на непрерывные участки из определённых точек,
// чтобы линия не соединялась через точку разрыва
std::vector<std::vector<SamplePoint>> splitSegments(const std::vector<SamplePoint>& points);

} // namespace grapher
