#include "generate_mode.hpp"
#include "console.hpp"
#include "expression_generator.hpp"
#include "file_utils.hpp"
#include "user_input.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

void runGenerateMode() {
    printHeader();

    std::cout << Color::BOLD << Color::CYAN << "Режим генерации функций\n" << Color::RESET << "\n";

    // 1. Количество функций и имя файла
    std::size_t expressionCount = askExpressionCount();
    std::filesystem::path fileName = selectGeneratedFileName(expressionCount);

    // 2. Файл кладём в папку tests рядом с остальными наборами
    std::filesystem::path testsDir = findProjectRoot() / "tests";
    std::filesystem::create_directories(testsDir);
    std::filesystem::path outputPath = testsDir / fileName;

    std::cout << "\n";
    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Количество функций: " << Color::CYAN << expressionCount << Color::RESET << "\n";
    std::cout << "  Выходной файл:      " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

    // 3. Генерация
    std::cout << Color::BOLD << "Генерация функций..." << Color::RESET << std::flush;
    auto startGen = std::chrono::steady_clock::now();

    std::ofstream output(outputPath);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл: " + outputPath.string());
    }

    grapher::FunctionGenerator generator;
    for (std::size_t i = 0; i < expressionCount; ++i) {
        // Глубина от 1 до 4: графики остаются читаемыми
        int depth = 1 + static_cast<int>(i % 4);
        output << generator.generate(depth) << "\n";

        // Показываем прогресс для больших файлов
        if ((i + 1) % 10000 == 0) {
            std::cout << "\r  " << Color::CYAN << (i + 1) << "/" << expressionCount
                << " функций сгенерировано..." << Color::RESET << std::flush;
        }
    }

    output.close();
    if (!output) {
        throw std::runtime_error("Ошибка записи в файл: " + outputPath.string());
    }

    auto genDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startGen);

    std::cout << "\r  " << Color::GREEN << "✓" << Color::RESET << " ("
        << expressionCount << " функций, " << genDuration.count() << " мс)\n\n";

    std::cout << Color::GREEN << "Файл успешно создан: " << outputPath << Color::RESET << "\n\n";
}
