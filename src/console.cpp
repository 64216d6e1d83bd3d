#include "console.hpp"

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║         Построитель графиков функций одной переменной     ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printRegistry(const grapher::SymbolRegistry& registry, std::ostream& out) {
    out << Color::BOLD << "Переменные: " << Color::RESET;
    for (const auto& [name, role] : registry.variables()) {
        out << Color::CYAN << name << Color::RESET << " ";
    }
    out << "\n" << Color::BOLD << "Функции:\n" << Color::RESET;
    for (const auto& function : registry.functions()) {
        std::string signature = function.name + "(" + std::to_string(function.arity) + ")";
        out << "  " << Color::CYAN << signature << Color::RESET;
        if (!function.description.empty()) {
            out << std::string(signature.size() < 10 ? 10 - signature.size() : 1, ' ')
                << Color::GRAY << function.description << Color::RESET;
        }
        out << "\n";
    }
    out << "\n";
}

void printError(const std::exception& error) {
    std::cerr << "\n" << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << error.what() << Color::RESET << "\n\n";
}

void printExpressionError(const std::string& text, const grapher::ExpressionError& error) {
    std::cerr << "\n  " << text << "\n";
    std::cerr << "  " << std::string(error.position(), ' ') << Color::RED << Color::BOLD << "^"
        << Color::RESET << "\n";
    printError(error);
}
