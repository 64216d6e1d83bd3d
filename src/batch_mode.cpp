#include "batch_mode.hpp"
#include "console.hpp"
#include "expression_processor.hpp"
#include "file_utils.hpp"
#include "limits.hpp"
#include "progress_bar.hpp"
#include "user_input.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <thread>
#include <vector>

namespace {

// Счётчики для итоговой статистики
struct BatchStatistics {
    std::size_t compiled = 0;
    std::size_t failed = 0;
    std::size_t undefinedPoints = 0;
};

void runBatchOnce() {
    // Интерактивный выбор файлов и параметров
    std::filesystem::path inputPath = selectInputFile();
    std::filesystem::path outputPath = selectOutputFile(inputPath);

    grapher::PlotSettings settings;
    settings.lowerLimit = askLimit("Левая граница", "lower_limit", settings.lowerLimit);
    settings.upperLimit = askLimit("Правая граница", "upper_limit", settings.upperLimit);
    grapher::validateLimits(settings.lowerLimit, settings.upperLimit);
    settings.sampleCount = askSampleCount(settings.sampleCount);
    std::size_t threadCount = selectThreadCount();

    std::cout << "\n" << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Входной файл:  " << Color::YELLOW << inputPath << Color::RESET << "\n";
    std::cout << "  Выходной файл: " << Color::YELLOW << outputPath << Color::RESET << "\n";
    std::cout << "  Диапазон:      " << Color::CYAN << "[" << settings.lowerLimit << "; "
        << settings.upperLimit << "], " << settings.sampleCount << " точек" << Color::RESET << "\n";
    std::cout << "  Потоков:       " << Color::CYAN << threadCount << Color::RESET << "\n\n";

    std::size_t totalLines = countLinesInFile(inputPath);

    std::cout << Color::BOLD << "Построение графиков:\n" << Color::RESET;
    auto start = std::chrono::steady_clock::now();

    grapher::CsvWriter writer(outputPath);
    BatchStatistics statistics;
    std::atomic<std::size_t> completed{0};

    // Результаты приходят не по порядку; копим их и пишем последовательно
    std::map<std::size_t, grapher::PlotRecord> pending;
    std::size_t nextLineToWrite = 1;

    auto processBatch = [&](std::vector<grapher::PlotRecord>& batch) {
        for (auto& record : batch) {
            if (record.status == "success") {
                ++statistics.compiled;
                for (const auto& point : record.points) {
                    if (!point.defined()) {
                        ++statistics.undefinedPoints;
                    }
                }
            } else {
                ++statistics.failed;
            }
            std::size_t number = record.lineNumber;
            pending.emplace(number, std::move(record));
        }

        // Записываем одним блоком все последовательные результаты, которые готовы
        std::vector<grapher::PlotRecord> ready;
        for (auto it = pending.find(nextLineToWrite); it != pending.end();
             it = pending.find(nextLineToWrite)) {
            ready.push_back(std::move(it->second));
            pending.erase(it);
            ++nextLineToWrite;
        }
        writer.write(ready);
    };

    std::thread progressThread(displayProgress, std::cref(completed), totalLines);
    try {
        grapher::ThreadPool pool(threadCount);
        grapher::processFunctionsStreaming(inputPath, settings, pool, completed, processBatch);
    }
    catch (...) {
        // Поток прогресса должен завершиться до выхода из функции
        completed.store(totalLines);
        progressThread.join();
        throw;
    }
    completed.store(totalLines);
    progressThread.join();

    // Хвост буфера (при корректной нумерации пуст)
    std::vector<grapher::PlotRecord> rest;
    for (auto& entry : pending) {
        rest.push_back(std::move(entry.second));
    }
    writer.write(rest);

    auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    std::cout << "\n" << Color::BOLD << "Статистика:\n" << Color::RESET;
    std::cout << "  Всего функций:        " << Color::CYAN << totalLines << Color::RESET << "\n";
    std::cout << "  Построено:            " << Color::GREEN << statistics.compiled << Color::RESET << "\n";
    if (statistics.failed > 0) {
        std::cout << "  Ошибок компиляции:    " << Color::RED << statistics.failed << Color::RESET << "\n";
    }
    std::cout << "  Неопределённых точек: " << Color::YELLOW << statistics.undefinedPoints
        << Color::RESET << "\n";
    std::cout << "  Время обработки:      " << Color::MAGENTA << elapsed.count() << " мс"
        << Color::RESET << "\n\n";

    std::cout << Color::GREEN << "Точки сохранены в: " << outputPath << Color::RESET << "\n\n";
}

} // namespace

void runBatchMode() {
    printHeader();
    std::cout << Color::BOLD << Color::CYAN << "Пакетный режим\n" << Color::RESET << "\n";

    bool continueProcessing = true;
    while (continueProcessing) {
        try {
            runBatchOnce();
        }
        catch (const std::exception& error) {
            printError(error);
        }

        continueProcessing = askYesNo("Обработать еще один файл?");
        if (continueProcessing) {
            std::cout << "\n";
        }
    }
}
