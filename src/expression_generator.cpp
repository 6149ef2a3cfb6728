#include "symalg/expression_generator.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace symalg {

ExpressionGenerator::ExpressionGenerator(GeneratorConfig config)
    : ExpressionGenerator(std::move(config), std::random_device{}()) {}

ExpressionGenerator::ExpressionGenerator(GeneratorConfig config, unsigned seed)
    : config(std::move(config)), gen(seed) {
    if (this->config.operators.empty()) {
        throw std::invalid_argument("Генератору нужен хотя бы один оператор");
    }
    if (this->config.minNumber > this->config.maxNumber) {
        throw std::invalid_argument("Некорректный диапазон чисел генератора");
    }
}

Expression ExpressionGenerator::generate(int depth) {
    // Базовый случай: на нулевой глубине только листья
    if (depth <= 0 || chance(config.leafProbability)) {
        return generateLeaf();
    }

    BinaryOp op = pickOperator();
    if (op == BinaryOp::Pow && config.constantExponents) {
        std::uniform_int_distribution<> exponentDist(0, config.maxExponent);
        return pow(generate(depth - 1), Expression(exponentDist(gen)));
    }

    Expression left = generate(depth - 1);
    Expression right = generate(depth - 1);
    return Expression(op, std::move(left), std::move(right));
}

std::string ExpressionGenerator::generateText(int depth) {
    std::string text = generate(depth).toSource();
    if (chance(config.errorProbability)) {
        return introduceError(text);
    }
    return text;
}

Expression ExpressionGenerator::generateLeaf() {
    if (!config.variables.empty() && chance(config.variableProbability)) {
        std::uniform_int_distribution<std::size_t> nameDist(0, config.variables.size() - 1);
        return Expression(config.variables[nameDist(gen)]);
    }
    return generateNumber();
}

Expression ExpressionGenerator::generateNumber() {
    if (chance(config.floatProbability)) {
        std::uniform_real_distribution<> realDist(config.minNumber, config.maxNumber);
        // Два знака после запятой, чтобы запись оставалась короткой
        return Expression(std::round(realDist(gen) * 100.0) / 100.0);
    }
    std::uniform_int_distribution<> intDist(config.minNumber, config.maxNumber);
    return Expression(intDist(gen));
}

BinaryOp ExpressionGenerator::pickOperator() {
    std::uniform_int_distribution<std::size_t> opDist(0, config.operators.size() - 1);
    return config.operators[opDist(gen)];
}

bool ExpressionGenerator::chance(double probability) {
    return unit_dist(gen) < probability;
}

// Вносит одну ошибку в текст выражения
std::string ExpressionGenerator::introduceError(const std::string& text) {
    std::uniform_int_distribution<> errorTypeDist(0, 2);
    std::string result = text;

    switch (errorTypeDist(gen)) {
    case 0: // Незакрытая скобка - убираем последнюю закрывающую
        if (auto pos = result.find_last_of(')'); pos != std::string::npos) {
            result.erase(pos, 1);
        } else {
            // Лист без скобок: открываем скобку, которую никто не закроет
            result = "(" + result;
        }
        break;
    case 1: // Неизвестный оператор вместо первого найденного
        if (auto pos = result.find(" + "); pos != std::string::npos) {
            result.replace(pos, 3, " % ");
        } else {
            result = "(" + result + " ^ 2)";
        }
        break;
    default: // Закрывающая скобка там, где ожидается операнд
        result = "() + " + result;
        break;
    }
    return result;
}

} // namespace symalg
