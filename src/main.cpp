#include "batch_mode.hpp"
#include "console.hpp"
#include "generate_mode.hpp"
#include "interactive_mode.hpp"

#include <iostream>
#include <string>

namespace {
void printUsage() {
    std::cout << "Использование:\n"
        << "  func_grapher           интерактивное построение графика\n"
        << "  func_grapher batch     построение графиков для файла функций\n"
        << "  func_grapher generate  генерация файла случайных функций\n";
}
}

// Точка входа в программу
int main(int argc, char** argv) {
    std::string mode = argc >= 2 ? argv[1] : "";

    try {
        if (mode.empty()) {
            runInteractiveMode();
        }
        else if (mode == "batch") {
            runBatchMode();
        }
        else if (mode == "generate") {
            runGenerateMode();
        }
        else {
            printUsage();
            return 1;
        }
    }
    catch (const std::exception& ex) {
        printError(ex);
        return 1;
    }

    std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
    return 0;
}
