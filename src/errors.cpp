#include "errors.hpp"

#include <sstream>

namespace grapher {

namespace {
std::string quoteChar(char ch) {
    std::string text = "'";
    text.push_back(ch);
    text.push_back('\'');
    return text;
}

std::string formatBound(double value) {
    std::ostringstream stream;
    stream << value;
    return stream.str();
}
}

LexError::LexError(std::size_t position, char character)
    : LexError(position, character,
               "Недопустимый символ " + quoteChar(character) + " в позиции " +
                   std::to_string(position)) {}

LexError::LexError(std::size_t position, char character, const std::string& message)
    : ExpressionError(message, position), ch(character) {}

SyntaxError::SyntaxError(std::size_t position, std::string expected, std::string found)
    : ExpressionError("Ожидалось " + expected + ", найдено " + found + " в позиции " +
                          std::to_string(position),
                      position),
      expectedText(std::move(expected)),
      foundText(std::move(found)) {}

UnknownIdentifier::UnknownIdentifier(std::string name, std::size_t position)
    : ExpressionError("Неизвестный идентификатор '" + name + "' в позиции " +
                          std::to_string(position),
                      position),
      identifier(std::move(name)) {}

ArityMismatch::ArityMismatch(std::string name, std::size_t expected, std::size_t got,
                             std::size_t position)
    : ExpressionError("Функция '" + name + "' принимает " + std::to_string(expected) +
                          " аргумент(ов), передано " + std::to_string(got) + " (позиция " +
                          std::to_string(position) + ")",
                      position),
      function(std::move(name)),
      expectedArity(expected),
      actualArity(got) {}

const char* toString(DomainErrorKind kind) {
    switch (kind) {
    case DomainErrorKind::DivByZero:
        return "DivByZero";
    case DomainErrorKind::InvalidPow:
        return "InvalidPow";
    case DomainErrorKind::LogDomain:
        return "LogDomain";
    case DomainErrorKind::SqrtDomain:
        return "SqrtDomain";
    case DomainErrorKind::NonFinite:
        return "NonFinite";
    }
    return "Unknown";
}

namespace {
std::string defaultDomainMessage(DomainErrorKind kind) {
    switch (kind) {
    case DomainErrorKind::DivByZero:
        return "Деление на ноль";
    case DomainErrorKind::InvalidPow:
        return "Отрицательное основание в нецелой степени";
    case DomainErrorKind::LogDomain:
        return "Логарифм определён только для положительных чисел";
    case DomainErrorKind::SqrtDomain:
        return "Корень из отрицательного числа";
    case DomainErrorKind::NonFinite:
        return "Результат не является конечным числом";
    }
    return "Ошибка области определения";
}
}

DomainError::DomainError(DomainErrorKind kind) : DomainError(kind, defaultDomainMessage(kind)) {}

DomainError::DomainError(DomainErrorKind kind, const std::string& message)
    : std::runtime_error(message), errorKind(kind) {}

InvalidRange::InvalidRange(double low, double high)
    : SamplingError("Некорректный диапазон: нижняя граница " + formatBound(low) +
                    " должна быть меньше верхней " + formatBound(high)),
      lowValue(low),
      highValue(high) {}

InvalidCount::InvalidCount(std::size_t count)
    : SamplingError("Количество точек должно быть не меньше 2, получено " +
                    std::to_string(count)),
      countValue(count) {}

UnboundVariable::UnboundVariable(std::string name)
    : SamplingError("Переменная '" + name + "' не задана при построении выборки"),
      variable(std::move(name)) {}

InvalidLimit::InvalidLimit(std::string name)
    : std::invalid_argument(name + " не является числом"), limitName(std::move(name)) {}

} // namespace grapher
