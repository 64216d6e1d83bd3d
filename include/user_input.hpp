#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

// Удаление пробелов и табуляций по краям
std::string trim(const std::string& value);

// Безопасный парсинг положительного целого числа из строки
std::size_t parseNumber(const std::string& value);

// Ввод определения функции; пустой ввод оставляет defaultFunction
std::string askFunction(const std::string& defaultFunction);

// Ввод границы диапазона; пустой ввод оставляет defaultValue.
// name попадает в текст InvalidLimit.
double askLimit(const std::string& prompt, const std::string& name, double defaultValue);

// Ввод количества точек; пустой ввод оставляет defaultCount.
// Меньше двух точек: InvalidCount сразу при вводе, до записи CSV.
std::size_t askSampleCount(std::size_t defaultCount);

// Интерактивный выбор файла с функциями (по одной на строку)
std::filesystem::path selectInputFile();

// Интерактивный выбор выходного CSV файла
std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath);

// Интерактивный ввод количества потоков
std::size_t selectThreadCount();

// Вопрос с ответом да/нет
bool askYesNo(const std::string& question);

// Интерактивный ввод количества функций для генерации
std::size_t askExpressionCount();

// Интерактивный выбор имени файла для генерации
std::filesystem::path selectGeneratedFileName(std::size_t expressionCount);
