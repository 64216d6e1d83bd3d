#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace grapher {

// --- Ошибки компиляции выражения ---
// Прерывают построение Expression целиком. Каждая несёт позицию в исходной
// строке, чтобы интерфейс мог подсветить место ошибки.
class ExpressionError : public std::runtime_error {
public:
    std::size_t position() const noexcept { return pos; }

protected:
    ExpressionError(const std::string& message, std::size_t position)
        : std::runtime_error(message), pos(position) {}

private:
    std::size_t pos;
};

// Недопустимый символ во входной строке
class LexError final : public ExpressionError {
public:
    LexError(std::size_t position, char character);
    LexError(std::size_t position, char character, const std::string& message);

    char character() const noexcept { return ch; }

private:
    char ch;
};

// Нарушение грамматики
class SyntaxError final : public ExpressionError {
public:
    SyntaxError(std::size_t position, std::string expected, std::string found);

    const std::string& expected() const noexcept { return expectedText; }
    const std::string& found() const noexcept { return foundText; }

private:
    std::string expectedText;
    std::string foundText;
};

// Имя переменной или функции отсутствует в реестре
class UnknownIdentifier final : public ExpressionError {
public:
    UnknownIdentifier(std::string name, std::size_t position);

    const std::string& name() const noexcept { return identifier; }

private:
    std::string identifier;
};

// Число аргументов не совпадает с арностью функции в реестре
class ArityMismatch final : public ExpressionError {
public:
    ArityMismatch(std::string name, std::size_t expected, std::size_t got, std::size_t position);

    const std::string& name() const noexcept { return function; }
    std::size_t expected() const noexcept { return expectedArity; }
    std::size_t got() const noexcept { return actualArity; }

private:
    std::string function;
    std::size_t expectedArity;
    std::size_t actualArity;
};

// --- Ошибки вычисления ---

enum class DomainErrorKind {
    DivByZero,  // Деление на точный ноль
    InvalidPow, // Отрицательное основание в нецелой степени
    LogDomain,  // Логарифм неположительного числа
    SqrtDomain, // Корень из отрицательного числа
    NonFinite   // Результат операции бесконечен или NaN
};

// Краткое имя вида ошибки: "DivByZero", "LogDomain" и т.д.
const char* toString(DomainErrorKind kind);

// Значение функции не определено в данной точке.
// Портит только одну точку выборки, а не весь график.
class DomainError final : public std::runtime_error {
public:
    explicit DomainError(DomainErrorKind kind);
    DomainError(DomainErrorKind kind, const std::string& message);

    DomainErrorKind kind() const noexcept { return errorKind; }

private:
    DomainErrorKind errorKind;
};

// --- Ошибки параметров выборки ---
// Бросаются до первого вычисления.
class SamplingError : public std::invalid_argument {
protected:
    using std::invalid_argument::invalid_argument;
};

class InvalidRange final : public SamplingError {
public:
    InvalidRange(double low, double high);

    double low() const noexcept { return lowValue; }
    double high() const noexcept { return highValue; }

private:
    double lowValue;
    double highValue;
};

class InvalidCount final : public SamplingError {
public:
    explicit InvalidCount(std::size_t count);

    std::size_t count() const noexcept { return countValue; }

private:
    std::size_t countValue;
};

// Выражению нужна переменная, которая не привязывается при выборке
class UnboundVariable final : public SamplingError {
public:
    explicit UnboundVariable(std::string name);

    const std::string& name() const noexcept { return variable; }

private:
    std::string variable;
};

// Текст границы диапазона не является конечным числом
class InvalidLimit final : public std::invalid_argument {
public:
    explicit InvalidLimit(std::string name);

    const std::string& name() const noexcept { return limitName; }

private:
    std::string limitName;
};

} // namespace grapher
