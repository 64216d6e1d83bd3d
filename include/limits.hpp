#pragma once

#include <cstddef>
#include <string>

namespace grapher {

// Разбор текста границы диапазона ("From"/"To" в окне графика).
// Пробелы по краям отбрасываются. Пустая строка, лишние символы после числа
// и бесконечные значения дают InvalidLimit с именем name.
double parseLimit(const std::string& text, const std::string& name);

// Нижняя граница должна быть строго меньше верхней, иначе InvalidRange
void validateLimits(double low, double high);

// На графике не меньше двух точек, иначе InvalidCount
void validateSampleCount(std::size_t count);

} // namespace grapher
