#pragma once

#include <atomic>
#include <cstddef>

// Отображение прогресс-бара построения графиков.
// Запускается в отдельном потоке и завершается, когда completed достигнет total.
void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total);
