#include "sampler.hpp"

#include "limits.hpp"

#include <cmath>

namespace grapher {

std::vector<SamplePoint> sample(const Expression& expression, const std::string& variable,
                                double low, double high, std::size_t count) {
    validateSampleCount(count);
    if (!std::isfinite(low) || !std::isfinite(high) || low >= high) {
        throw InvalidRange(low, high);
    }
    for (const auto& name : expression.freeVariables()) {
        if (name != variable) {
            throw UnboundVariable(name);
        }
    }

    const double last = static_cast<double>(count - 1);

    std::vector<SamplePoint> points;
    points.reserve(count);
    Bindings bindings{{variable, low}};
    double& x = bindings.at(variable);

    for (std::size_t i = 0; i < count; ++i) {
        // Интерполяция без high - low: ширина [-1e308, 1e308] не помещается в double
        const double t = static_cast<double>(i) / last;
        x = (i + 1 == count) ? high : low * (1.0 - t) + high * t;
        try {
            points.push_back({x, expression.evaluate(bindings), std::nullopt});
        }
        catch (const DomainError& error) {
            points.push_back({x, std::nullopt, error.kind()});
        }
    }
    return points;
}

std::vector<std::vector<SamplePoint>> splitSegments(const std::vector<SamplePoint>& points) {
    std::vector<std::vector<SamplePoint>> segments;
    bool open = false;
    for (const auto& point : points) {
        if (!point.defined()) {
            open = false;
            continue;
        }
        if (!open) {
            segments.emplace_back();
            open = true;
        }
        segments.back().push_back(point);
    }
    return segments;
}

} // namespace grapher
