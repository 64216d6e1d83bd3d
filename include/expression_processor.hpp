#pragma once

#include "csv_writer.hpp"
#include "plot_settings.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

namespace grapher {

// Компилирует одну строку файла и строит по ней точки с параметрами settings.
// Ошибки компиляции и пустая строка превращаются в запись со статусом error;
// неопределённые точки остаются в records.points с пустым y.
PlotRecord plotFunction(std::size_t lineNumber, const std::string& text, const PlotSettings& settings);

// Потоковое чтение и обработка файла по частям (chunks) для экономии памяти.
// Каждая строка содержит отдельную функцию; задачи уходят в пул потоков,
// futures собираются батчами и передаются в processBatch.
template <typename ProcessCallback>
void processFunctionsStreaming(
    const std::filesystem::path& path,
    const PlotSettings& settings,
    ThreadPool& pool,
    std::atomic<std::size_t>& completed,
    ProcessCallback&& processBatch,
    std::size_t chunkSize = 1000,  // Читаем по 1000 строк за раз
    std::size_t batchSize = 100) { // Собираем futures батчами по 100

    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + path.string());
    }

    std::vector<std::future<PlotRecord>> futures;
    futures.reserve(batchSize);

    auto flushFutures = [&]() {
        if (futures.empty()) return;

        std::vector<PlotRecord> batch;
        batch.reserve(futures.size());
        for (auto& future : futures) {
            batch.push_back(future.get());
        }
        processBatch(batch);
        futures.clear();
    };

    auto submitChunk = [&](std::vector<std::pair<std::size_t, std::string>>& chunk) {
        for (auto& entry : chunk) {
            futures.emplace_back(pool.enqueue(
                [number = entry.first, text = std::move(entry.second), &settings, &completed]() {
                    PlotRecord record = plotFunction(number, text, settings);
                    completed.fetch_add(1); // Обновляем прогресс
                    return record;
                }));
            if (futures.size() >= batchSize) {
                flushFutures();
            }
        }
        chunk.clear();
    };

    std::vector<std::pair<std::size_t, std::string>> chunk;
    chunk.reserve(chunkSize);
    std::string line;
    std::size_t lineNumber = 1;

    while (std::getline(input, line)) {
        chunk.emplace_back(lineNumber++, std::move(line));
        if (chunk.size() >= chunkSize) {
            submitChunk(chunk);
        }
    }

    // Оставшиеся строки (если их меньше chunkSize) и futures
    submitChunk(chunk);
    flushFutures();
}

} // namespace grapher
