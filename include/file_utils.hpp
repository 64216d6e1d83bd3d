#pragma once

#include <filesystem>
#include <string>
#include <vector>

// Подсчёт строк в файле функций; последняя строка без '\n' тоже считается
std::size_t countLinesInFile(const std::filesystem::path& path);

// Поиск корневой директории проекта (ищет папку tests или файл CMakeLists.txt)
std::filesystem::path findProjectRoot();

// Файлы с функциями (*.txt, без учёта регистра расширения) в директории, по алфавиту
std::vector<std::filesystem::path> findFunctionFiles(const std::filesystem::path& directory);

// Текущее время для имени файла: 20240131_235959
std::string getCurrentTimeString();
