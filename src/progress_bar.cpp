#include "progress_bar.hpp"
#include "console.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>

namespace {
constexpr int kBarWidth = 50;

void drawBar(std::size_t current, std::size_t total, const char* color) {
    float progress = total == 0 ? 1.0f : static_cast<float>(current) / total;
    int pos = static_cast<int>(kBarWidth * progress);

    std::cout << "\r  " << color << "[";
    for (int i = 0; i < kBarWidth; ++i) {
        if (i < pos) std::cout << "█";
        else if (i == pos) std::cout << "▒";
        else std::cout << "░";
    }
    std::cout << "] " << Color::BOLD << std::setw(3) << static_cast<int>(progress * 100.0f)
        << "%" << Color::RESET << " (" << current << "/" << total << " функций)";
    std::cout.flush();
}
}

void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total) {
    while (completed.load() < total) {
        drawBar(completed.load(), total, Color::CYAN);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    // Финальное обновление до 100%
    drawBar(total, total, Color::GREEN);
    std::cout << "\n";
}
