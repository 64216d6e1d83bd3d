#pragma once

#include <exception>
#include <iostream>
#include <string>

#include "errors.hpp"
#include "symbol_registry.hpp"

// ANSI цветовые коды для форматирования вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GRAY = "\033[90m";
}

// Вывод приветственного заголовка программы
void printHeader();

// Справка по доступным переменным и функциям реестра с их описаниями
void printRegistry(const grapher::SymbolRegistry& registry, std::ostream& out = std::cout);

// Вывод сообщения об ошибке в stderr: "✗ Ошибка: ..."
void printError(const std::exception& error);

// Вывод ошибки компиляции с подсветкой позиции:
//   sin(x
//        ^
void printExpressionError(const std::string& text, const grapher::ExpressionError& error);
