#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::size_t countLinesInFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для подсчета строк: " + path.string());
    }

    // Читаем блоками по 1 МБ
    std::vector<char> buffer(1024 * 1024);
    std::size_t lineCount = 0;
    char lastChar = '\n';

    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        auto bytesRead = static_cast<std::size_t>(input.gcount());
        lineCount += static_cast<std::size_t>(std::count(buffer.begin(), buffer.begin() + bytesRead, '\n'));
        lastChar = buffer[bytesRead - 1];
    }

    // Последняя строка без перевода строки
    if (lastChar != '\n') {
        ++lineCount;
    }
    return lineCount;
}

std::filesystem::path findProjectRoot() {
    std::error_code error;
    std::filesystem::path current = std::filesystem::current_path(error);
    if (error) {
        return std::filesystem::path(".");
    }

    // Поднимаемся вверх по директориям, пока не найдем папку tests или CMakeLists.txt
    for (auto dir = current; !dir.empty(); dir = dir.parent_path()) {
        if (std::filesystem::is_directory(dir / "tests", error) ||
            std::filesystem::is_regular_file(dir / "CMakeLists.txt", error)) {
            return dir;
        }
        if (dir == dir.root_path()) {
            break;
        }
    }

    // Если не нашли, возвращаем текущую директорию
    return current;
}

std::vector<std::filesystem::path> findFunctionFiles(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> files;
    std::error_code error;
    if (!std::filesystem::is_directory(directory, error)) {
        return files;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory, error)) {
        if (!entry.is_regular_file(error)) {
            continue;
        }
        std::string extension = entry.path().extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (extension == ".txt") {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string getCurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}
