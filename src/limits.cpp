#include "limits.hpp"

#include "errors.hpp"

#include <cmath>
#include <stdexcept>

namespace grapher {

double parseLimit(const std::string& text, const std::string& name) {
    // Удаление пробелов
    std::string trimmed = text;
    trimmed.erase(0, trimmed.find_first_not_of(" \t"));
    trimmed.erase(trimmed.find_last_not_of(" \t") + 1);

    if (trimmed.empty()) {
        throw InvalidLimit(name);
    }

    double value = 0.0;
    std::size_t consumed = 0;
    try {
        value = std::stod(trimmed, &consumed);
    }
    catch (const std::logic_error&) {
        // invalid_argument и out_of_range
        throw InvalidLimit(name);
    }

    if (consumed != trimmed.size() || !std::isfinite(value)) {
        throw InvalidLimit(name);
    }
    return value;
}

void validateLimits(double low, double high) {
    if (low >= high) {
        throw InvalidRange(low, high);
    }
}

void validateSampleCount(std::size_t count) {
    if (count < 2) {
        throw InvalidCount(count);
    }
}

} // namespace grapher
