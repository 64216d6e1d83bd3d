#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "sampler.hpp"

namespace grapher {

// Результат обработки одной строки входного файла
struct PlotRecord {
    std::size_t lineNumber;          // Номер строки в исходном файле
    std::string expression;          // Исходный текст функции
    std::string status;              // success или error
    std::string message;             // Сообщение об ошибке компиляции (если есть)
    std::vector<SamplePoint> points; // Точки графика (пусто при ошибке)
};

// Класс для записи точек графиков в формате CSV (Comma-Separated Values)
// Формат: line,expression,status,x,y,message
// Одна строка на точку; для нескомпилированной функции одна строка с ошибкой.
class CsvWriter {
public:
    // Конструктор открывает файл для записи (перезаписывая его) и пишет заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Записывает один результат в файл (для потоковой записи)
    void writeRecord(const PlotRecord& record) const;

    // Записывает пакет результатов
    void write(const std::vector<PlotRecord>& records) const;

private:
    std::filesystem::path path; // Путь к выходному файлу

    void writeRows(std::ofstream& stream, const PlotRecord& record) const;
};

} // namespace grapher
