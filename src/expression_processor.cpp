#include "expression_processor.hpp"

#include "errors.hpp"
#include "expression.hpp"
#include "sampler.hpp"
#include "user_input.hpp"

namespace grapher {

PlotRecord plotFunction(std::size_t lineNumber, const std::string& text, const PlotSettings& settings) {
    PlotRecord record{lineNumber, text, "success", "", {}};
    std::string definition = trim(text);
    if (definition.empty()) {
        record.status = "error";
        record.message = "Пустая строка";
        return record;
    }

    try {
        Expression expression = Expression::compile(definition);
        record.points = sample(expression, settings.variable, settings.lowerLimit,
                               settings.upperLimit, settings.sampleCount);
    }
    catch (const ExpressionError& error) {
        record.status = "error";
        record.message = error.what();
    }
    return record;
}

} // namespace grapher
