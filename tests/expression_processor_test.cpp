#include "expression_processor.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace grapher;

namespace {
PlotSettings smallSettings() {
    PlotSettings settings;
    settings.lowerLimit = -1.0;
    settings.upperLimit = 1.0;
    settings.sampleCount = 5;
    return settings;
}
}

TEST(PlotFunctionTest, CompiledFunctionProducesPoints) {
    auto record = plotFunction(4, "  x^2 ", smallSettings());

    EXPECT_EQ(record.lineNumber, 4u);
    EXPECT_EQ(record.status, "success");
    EXPECT_TRUE(record.message.empty());
    ASSERT_EQ(record.points.size(), 5u);
    EXPECT_EQ(*record.points.front().y, 1.0);
    EXPECT_EQ(*record.points[2].y, 0.0);
}

TEST(PlotFunctionTest, UndefinedPointsStaySuccess) {
    auto record = plotFunction(1, "sqrt(x)", smallSettings());

    EXPECT_EQ(record.status, "success");
    ASSERT_EQ(record.points.size(), 5u);
    EXPECT_FALSE(record.points[0].defined());
    EXPECT_TRUE(record.points[4].defined());
}

TEST(PlotFunctionTest, CompileErrorsBecomeErrorRecords) {
    for (const char* text : {"sin(x", "foo(x)", "sin(x, 1)", "x $ 2", "y + 1"}) {
        auto record = plotFunction(2, text, smallSettings());
        EXPECT_EQ(record.status, "error") << text;
        EXPECT_FALSE(record.message.empty()) << text;
        EXPECT_TRUE(record.points.empty()) << text;
        EXPECT_EQ(record.expression, text);
    }
}

TEST(PlotFunctionTest, EmptyLineIsError) {
    auto record = plotFunction(9, "   ", smallSettings());
    EXPECT_EQ(record.status, "error");
    EXPECT_EQ(record.message, "Пустая строка");
}

TEST(ProcessFunctionsStreamingTest, KeepsEveryLineAndItsNumber) {
    auto path = std::filesystem::temp_directory_path() / "func_grapher_streaming_input.txt";
    const std::vector<std::string> lines = {"x", "sin(x)", "foo(x)", "", "1/x", "abs(x) + 1", "(x"};
    {
        std::ofstream output(path);
        for (const auto& line : lines) {
            output << line << '\n';
        }
    }

    ThreadPool pool(3);
    std::atomic<std::size_t> completed{0};
    std::vector<PlotRecord> records;
    std::size_t batches = 0;

    processFunctionsStreaming(
        path, smallSettings(), pool, completed,
        [&](std::vector<PlotRecord>& batch) {
            ++batches;
            for (auto& record : batch) {
                records.push_back(std::move(record));
            }
        },
        2, 3);

    std::filesystem::remove(path);

    EXPECT_EQ(completed.load(), lines.size());
    EXPECT_EQ(batches, 3u);
    ASSERT_EQ(records.size(), lines.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        // Внутри пакета порядок futures совпадает с порядком строк
        EXPECT_EQ(records[i].lineNumber, i + 1);
        EXPECT_EQ(records[i].expression, lines[i]);
    }
    EXPECT_EQ(records[2].status, "error");
    EXPECT_EQ(records[3].status, "error");
    EXPECT_EQ(records[4].status, "success");
    EXPECT_EQ(records[6].status, "error");
}

TEST(ProcessFunctionsStreamingTest, MissingFileIsReported) {
    ThreadPool pool(1);
    std::atomic<std::size_t> completed{0};
    EXPECT_THROW(processFunctionsStreaming(std::filesystem::path("/nonexistent/functions.txt"),
                                           smallSettings(), pool, completed,
                                           [](std::vector<PlotRecord>&) {}),
                 std::runtime_error);
}
