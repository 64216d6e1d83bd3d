#include "csv_writer.hpp"

#include <iomanip>
#include <stdexcept>

namespace grapher {

namespace {
// Замена двойных кавычек на одинарные и оборачивание в кавычки
std::string quoted(const std::string& text) {
    std::string sanitized = text;
    for (char& ch : sanitized) {
        if (ch == '"') {
            ch = '\'';
        }
    }
    return '"' + sanitized + '"';
}

std::ofstream openForAppend(const std::filesystem::path& path) {
    std::ofstream stream(path, std::ios::app);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    // Настройка формата вывода чисел
    stream.setf(std::ios::fixed);
    stream << std::setprecision(10);
    return stream;
}
}

CsvWriter::CsvWriter(std::filesystem::path targetPath) : path(std::move(targetPath)) {
    std::ofstream stream(path, std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    stream << "line,expression,status,x,y,message\n";
}

void CsvWriter::writeRecord(const PlotRecord& record) const {
    auto stream = openForAppend(path);
    writeRows(stream, record);
}

void CsvWriter::write(const std::vector<PlotRecord>& records) const {
    auto stream = openForAppend(path);
    for (const auto& record : records) {
        writeRows(stream, record);
    }
}

void CsvWriter::writeRows(std::ofstream& stream, const PlotRecord& record) const {
    const std::string prefix =
        std::to_string(record.lineNumber) + ',' + quoted(record.expression) + ',' + record.status + ',';

    if (record.points.empty()) {
        stream << prefix << ",," << quoted(record.message) << '\n';
        return;
    }

    for (const auto& point : record.points) {
        stream << prefix << point.x << ',';
        // Неопределённая точка: пустое значение y и вид ошибки в сообщении
        if (point.y.has_value()) {
            stream << point.y.value() << ',' << quoted(record.message) << '\n';
        } else {
            std::string reason = point.failure ? toString(*point.failure) : "undefined";
            stream << ',' << quoted(reason) << '\n';
        }
    }
}

} // namespace grapher
