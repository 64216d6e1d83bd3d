#include "interactive_mode.hpp"
#include "console.hpp"
#include "csv_writer.hpp"
#include "expression.hpp"
#include "limits.hpp"
#include "plot_settings.hpp"
#include "sampler.hpp"
#include "user_input.hpp"
#include "file_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace {

// Количество строк в таблице предпросмотра
constexpr std::size_t kPreviewRows = 11;

void printSummary(const std::vector<grapher::SamplePoint>& points) {
    std::size_t defined = 0;
    double minY = 0.0;
    double maxY = 0.0;
    for (const auto& point : points) {
        if (!point.defined()) {
            continue;
        }
        if (defined == 0) {
            minY = maxY = *point.y;
        }
        minY = std::min(minY, *point.y);
        maxY = std::max(maxY, *point.y);
        ++defined;
    }

    std::cout << "\n" << Color::BOLD << "Сводка:\n" << Color::RESET;
    std::cout << "  Всего точек:        " << Color::CYAN << points.size() << Color::RESET << "\n";
    std::cout << "  Определено:         " << Color::GREEN << defined << Color::RESET << "\n";
    if (defined < points.size()) {
        std::cout << "  Не определено:      " << Color::RED << points.size() - defined << Color::RESET << "\n";
    }
    std::cout << "  Участков кривой:    " << Color::CYAN << grapher::splitSegments(points).size()
        << Color::RESET << "\n";
    if (defined > 0) {
        std::cout << "  Диапазон значений:  " << Color::MAGENTA << "[" << minY << "; " << maxY << "]"
            << Color::RESET << "\n";
    }

    // Таблица из равномерно выбранных точек
    std::cout << "\n" << Color::BOLD << "          x              y\n" << Color::RESET;
    std::size_t rows = std::min(kPreviewRows, points.size());
    for (std::size_t row = 0; row < rows; ++row) {
        const auto& point = points[row * (points.size() - 1) / (rows - 1)];
        std::cout << "  " << std::setw(12) << point.x << "   ";
        if (point.defined()) {
            std::cout << std::setw(12) << *point.y << "\n";
        } else {
            std::cout << Color::GRAY << std::setw(12) << "—" << "  "
                << grapher::toString(*point.failure) << Color::RESET << "\n";
        }
    }
    std::cout << "\n";
}

void saveToCsv(const std::string& function, const std::vector<grapher::SamplePoint>& points) {
    std::filesystem::path path =
        std::filesystem::current_path() / ("plot_" + getCurrentTimeString() + ".csv");
    grapher::CsvWriter writer(path);
    writer.writeRecord({1, function, "success", "", points});
    std::cout << Color::GREEN << "Точки сохранены в: " << path << Color::RESET << "\n\n";
}

} // namespace

void runInteractiveMode() {
    printHeader();
    printRegistry(grapher::SymbolRegistry::standard());

    grapher::PlotSettings settings;
    bool continuePlotting = true;

    while (continuePlotting) {
        std::string text;
        try {
            // Новое выражение строится с нуля; старое просто уничтожается
            text = askFunction(settings.function);
            grapher::Expression expression = grapher::Expression::compile(text);
            settings.function = text;
            std::cout << "  Разобрано как: " << Color::CYAN << expression.toString() << Color::RESET << "\n\n";

            settings.lowerLimit = askLimit("Левая граница", "lower_limit", settings.lowerLimit);
            settings.upperLimit = askLimit("Правая граница", "upper_limit", settings.upperLimit);
            grapher::validateLimits(settings.lowerLimit, settings.upperLimit);
            settings.sampleCount = askSampleCount(settings.sampleCount);

            auto points = grapher::sample(expression, settings.variable, settings.lowerLimit,
                                          settings.upperLimit, settings.sampleCount);
            printSummary(points);

            if (askYesNo("Сохранить точки в CSV?")) {
                saveToCsv(settings.function, points);
            }
        }
        catch (const grapher::ExpressionError& error) {
            printExpressionError(text, error);
        }
        catch (const std::exception& error) {
            printError(error);
        }

        continuePlotting = askYesNo("Построить другую функцию?");
        if (continuePlotting) {
            std::cout << "\n";
        }
    }
}
