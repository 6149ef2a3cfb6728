// Генератор случайных выражений.
// Используется режимом generate и property-тестами. Может вносить в текст
// редкие синтаксические ошибки (незакрытая скобка, неизвестный оператор,
// лишняя закрывающая скобка), чтобы проверять обработку ошибок разбора.
//

#pragma once

#include <random>
#include <string>
#include <vector>

#include "symalg/ast.hpp"

namespace symalg {

struct GeneratorConfig {
    std::vector<std::string> variables = {"x", "y", "z"};
    std::vector<BinaryOp> operators = {BinaryOp::Add, BinaryOp::Sub, BinaryOp::Mul,
                                       BinaryOp::Div, BinaryOp::Pow};
    int minNumber = -10;
    int maxNumber = 10;
    double floatProbability = 0.2;   // Доля вещественных литералов среди чисел
    double variableProbability = 0.5; // Доля переменных среди листьев
    double leafProbability = 0.1;    // Шанс оборвать ветку раньше максимальной глубины

    // Показатель степени - всегда целый литерал из [0, maxExponent],
    // чтобы выражение можно было дифференцировать
    bool constantExponents = true;
    int maxExponent = 3;

    // Вероятность внести синтаксическую ошибку в текст (только generateText)
    double errorProbability = 0.0;
};

class ExpressionGenerator {
public:
    explicit ExpressionGenerator(GeneratorConfig config = {});
    ExpressionGenerator(GeneratorConfig config, unsigned seed);

    // Случайное дерево глубины не больше depth
    Expression generate(int depth);

    // Полностью скобочная запись случайного дерева, возможно с ошибкой
    std::string generateText(int depth);

private:
    GeneratorConfig config;
    std::mt19937 gen;
    std::uniform_real_distribution<> unit_dist{0.0, 1.0};

    Expression generateLeaf();
    Expression generateNumber();
    BinaryOp pickOperator();
    bool chance(double probability);

    std::string introduceError(const std::string& text);
};

} // namespace symalg
