#include "user_input.hpp"
#include "console.hpp"
#include "file_utils.hpp"
#include "limits.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {
// Чтение строки ответа с приглашением; конец ввода считается ошибкой
std::string readAnswer(const std::string& prompt) {
    std::cout << Color::BOLD << prompt << Color::RESET;
    std::string input;
    if (!std::getline(std::cin, input)) {
        throw std::runtime_error("Ввод завершён");
    }
    return trim(input);
}

// Добавляет расширение, если его нет
std::filesystem::path withExtension(std::filesystem::path path, const std::string& extension) {
    if (path.extension() != extension) {
        path.replace_extension(extension);
    }
    return path;
}
}

std::string trim(const std::string& value) {
    std::string result = value;
    result.erase(0, result.find_first_not_of(" \t\r"));
    result.erase(result.find_last_not_of(" \t\r") + 1);
    return result;
}

std::size_t parseNumber(const std::string& value) {
    // stoul принимает знак минус, поэтому допускаем только цифры
    bool digitsOnly = !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
    if (!digitsOnly) {
        throw std::runtime_error("Некорректное числовое значение: " + value);
    }

    std::size_t result = 0;
    try {
        result = std::stoul(value);
    }
    catch (const std::out_of_range&) {
        throw std::runtime_error("Некорректное числовое значение: " + value);
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

std::string askFunction(const std::string& defaultFunction) {
    std::string input = readAnswer("Функция f(x) (по умолчанию: " + defaultFunction + "): ");
    return input.empty() ? defaultFunction : input;
}

double askLimit(const std::string& prompt, const std::string& name, double defaultValue) {
    std::string input = readAnswer(prompt + " (по умолчанию: " + std::to_string(defaultValue) + "): ");
    if (input.empty()) {
        return defaultValue;
    }
    return grapher::parseLimit(input, name);
}

std::size_t askSampleCount(std::size_t defaultCount) {
    std::string input =
        readAnswer("Количество точек (по умолчанию: " + std::to_string(defaultCount) + "): ");
    std::size_t count = input.empty() ? defaultCount : parseNumber(input);
    grapher::validateSampleCount(count);
    return count;
}

std::filesystem::path selectInputFile() {
    std::filesystem::path testsDir = findProjectRoot() / "tests";
    auto files = findFunctionFiles(testsDir);

    if (files.empty()) {
        std::cout << Color::YELLOW << "Внимание: " << Color::RESET
            << "не найдено .txt файлов в папке tests.\n";
        std::cout << "Директория: " << Color::CYAN << testsDir << Color::RESET << "\n\n";
    }
    else {
        std::cout << Color::BOLD << "Найденные файлы функций в папке tests:\n" << Color::RESET;
        for (std::size_t i = 0; i < files.size(); ++i) {
            std::cout << "  " << Color::CYAN << (i + 1) << Color::RESET << ". "
                << Color::YELLOW << files[i].filename().string() << Color::RESET << "\n";
        }
        std::cout << "\n";
    }

    std::string input = readAnswer("Введите номер файла или путь до входного файла: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }

    bool isNumber = std::all_of(input.begin(), input.end(),
                                [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (isNumber && !files.empty()) {
        std::size_t index = parseNumber(input);
        if (index > files.size()) {
            throw std::runtime_error("Номер файла вне допустимого диапазона");
        }
        return files[index - 1];
    }

    // Пользователь ввел путь
    std::filesystem::path inputPath = input;
    if (!std::filesystem::exists(inputPath)) {
        throw std::runtime_error("Файл не найден: " + inputPath.string());
    }
    return inputPath;
}

std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath) {
    std::cout << Color::BOLD << "Выберите способ задания выходного файла:\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". Название по умолчанию (имя входного файла + _points_ + время)\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". Кастомное название\n\n";

    std::string choice = readAnswer("Ваш выбор (1 или 2): ");

    if (choice == "1") {
        std::string stem = inputPath.stem().string();
        return inputPath.parent_path() / (stem + "_points_" + getCurrentTimeString() + ".csv");
    }
    if (choice == "2") {
        std::string customName = readAnswer(
            "Введите название выходного файла (можно с путем, расширение .csv добавится автоматически): ");
        if (customName.empty()) {
            throw std::runtime_error("Пустое название файла");
        }

        std::filesystem::path customPath(customName);
        // Относительный путь считаем от директории входного файла
        if (!customPath.is_absolute()) {
            customPath = inputPath.parent_path() / customPath;
        }
        return withExtension(customPath, ".csv");
    }
    throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
}

std::size_t selectThreadCount() {
    std::size_t defaultThreads = std::thread::hardware_concurrency();
    if (defaultThreads == 0) {
        defaultThreads = 2; // Резервное значение
    }

    std::string input =
        readAnswer("Введите количество потоков (по умолчанию: " + std::to_string(defaultThreads) + "): ");
    if (input.empty()) {
        return defaultThreads;
    }
    return parseNumber(input);
}

bool askYesNo(const std::string& question) {
    std::string input;
    try {
        input = readAnswer(question + " (y/n): ");
    }
    catch (const std::runtime_error&) {
        // Конец ввода считается ответом "нет"
        return false;
    }
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    return input == "y" || input == "yes" || input == "д" || input == "да";
}

std::size_t askExpressionCount() {
    std::string input = readAnswer("Введите количество функций для генерации: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }
    return parseNumber(input);
}

std::filesystem::path selectGeneratedFileName(std::size_t expressionCount) {
    std::cout << Color::BOLD << "Выберите способ задания имени файла:\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". Автоматическое название (functions_" << expressionCount << ".txt)\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". Кастомное название\n\n";

    std::string choice = readAnswer("Ваш выбор (1 или 2): ");

    if (choice == "1") {
        return std::filesystem::path("functions_" + std::to_string(expressionCount) + ".txt");
    }
    if (choice == "2") {
        std::string customName =
            readAnswer("Введите название файла (расширение .txt добавится автоматически): ");
        if (customName.empty()) {
            throw std::runtime_error("Пустое название файла");
        }
        return withExtension(std::filesystem::path(customName), ".txt");
    }
    throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
}
