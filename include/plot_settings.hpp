#pragma once

#include <cstddef>
#include <string>

namespace grapher {

// Параметры построения графика. Значения по умолчанию
// совпадают с начальным состоянием окна графопостроителя.
struct PlotSettings {
    std::string function = "x";     // Определение функции
    std::string variable = "x";     // Независимая переменная
    double lowerLimit = 0.0;        // Левая граница (From)
    double upperLimit = 10.0;       // Правая граница (To)
    std::size_t sampleCount = 501;  // Количество точек на отрезке
};

} // namespace grapher
