// Генератор определений функций для нагрузочных файлов пакетного режима.
// Использует переменную x, функции стандартного реестра, операции + - * / ^ и скобки.
// С малой вероятностью вносит ошибки: неизвестное имя, лишний символ,
// незакрытую скобку, лишний аргумент функции.
//

#pragma once

#include <cstdio>
#include <random>
#include <string>
#include <vector>

#include "symbol_registry.hpp"

namespace grapher {

// Вероятность внесения ошибки в узел (5%)
constexpr double kErrorProbability = 0.05;

class FunctionGenerator {
public:
    explicit FunctionGenerator(unsigned seed = std::random_device{}())
        : gen(seed),
          num_dist(-5.0, 5.0),
          op_dist(0, 4),
          func_dist(0, functionNames().size() - 1),
          error_dist(0.0, 1.0),
          error_type_dist(0, 3),
          leaf_dist(0, 2),
          type_roll_dist(0, 19),
          exponent_dist(2, 3) {}

    std::string generate(int depth) {
        // Базовый случай: переменная или число
        if (depth <= 0) {
            return generateLeaf();
        }

        // 0-13 бинарная операция (70%), 14-18 функция (25%), 19 лист (5%)
        int type_roll = type_roll_dist(gen);

        if (type_roll < 14) {
            char op = operations[op_dist(gen)];
            std::string left = generate(depth - 1);
            // Показатель степени держим маленьким целым, чтобы графики не улетали
            std::string right = op == '^' ? std::to_string(exponent_dist(gen)) : generate(depth - 1);
            return introduceError("(" + left + " " + op + " " + right + ")");
        }
        if (type_roll < 19) {
            const std::string& func = functionNames()[func_dist(gen)];
            return introduceError(func + "(" + generate(depth - 1) + ")");
        }
        return generateLeaf();
    }

private:
    std::mt19937 gen;
    std::uniform_real_distribution<> num_dist;
    std::uniform_int_distribution<> op_dist;
    std::uniform_int_distribution<std::size_t> func_dist;
    std::uniform_real_distribution<> error_dist;
    std::uniform_int_distribution<> error_type_dist;
    std::uniform_int_distribution<> leaf_dist;
    std::uniform_int_distribution<> type_roll_dist;
    std::uniform_int_distribution<> exponent_dist;

    std::vector<char> operations = {'+', '-', '*', '/', '^'};

    // Имена функций стандартного реестра
    static const std::vector<std::string>& functionNames() {
        static const std::vector<std::string> names = [] {
            std::vector<std::string> result;
            for (const auto& function : SymbolRegistry::standard().functions()) {
                result.push_back(function.name);
            }
            return result;
        }();
        return names;
    }

    // Две трети листьев: переменная x, остальные числа
    std::string generateLeaf() {
        if (leaf_dist(gen) < 2) {
            return "x";
        }
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.2f", num_dist(gen));
        return std::string(buffer);
    }

    // Вносит ошибки в выражение с малой вероятностью
    std::string introduceError(const std::string& expr) {
        if (error_dist(gen) >= kErrorProbability) {
            return expr;
        }

        std::string result = expr;
        switch (error_type_dist(gen)) {
        case 0: // Незакрытая скобка: убираем последнюю закрывающую
            for (std::size_t i = result.size(); i > 0; --i) {
                if (result[i - 1] == ')') {
                    result.erase(i - 1, 1);
                    break;
                }
            }
            return result;
        case 1: // Недопустимый символ посередине
            result.insert(result.size() / 2, 1, '#');
            return result;
        case 2: // Неизвестная функция
            return "foo(" + result + ")";
        case 3: // Лишний аргумент
            return "sin(" + result + ", x)";
        default:
            return result;
        }
    }
};

} // namespace grapher
