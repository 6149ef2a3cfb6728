#pragma once

#include <concepts>
#include <limits>
#include <memory>
#include <ostream>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>

#include "symalg/numeric.hpp"

namespace symalg {

// Таблица значений переменных для вычисления
using Bindings = std::unordered_map<std::string, double>;

// Бинарные операции дерева. Набор закрыт: каждая операция над деревом
// разбирает все пять случаев в switch без default.
enum class BinaryOp { Add, Sub, Mul, Div, Pow };

enum class ExpressionKind { Number, Variable, Binary };

// Константы печати, общие для всех узлов одной операции
struct OperatorTraits {
    const char* symbol;
    int precedence;
    bool wrapLeftAtSamePrecedence;  // Скобки вокруг левого потомка того же приоритета
    bool wrapRightAtSamePrecedence; // Скобки вокруг правого потомка того же приоритета
};

// Приоритет листьев: выше любой операции, листья никогда не берутся в скобки
constexpr int kLeafPrecedence = std::numeric_limits<int>::max();

constexpr OperatorTraits traitsOf(BinaryOp op) {
    switch (op) {
    case BinaryOp::Add:
        return {"+", 1, false, false};
    case BinaryOp::Sub:
        return {"-", 1, false, true};
    case BinaryOp::Mul:
        return {"*", 2, false, false};
    case BinaryOp::Div:
        return {"/", 2, false, true};
    case BinaryOp::Pow:
        return {"**", 3, true, false};
    }
    return {"?", 0, false, false};
}

// Неизменяемое дерево алгебраического выражения.
// Узел - это число, переменная или бинарная операция, владеющая своими
// потомками единолично. Копирование дерева глубокое, перемещение дешёвое.
// simplify() и deriv() всегда строят новое дерево.
class Expression {
public:
    struct Number {
        Numeric value;
    };

    struct Variable {
        std::string name;
    };

    struct Binary {
        BinaryOp op;
        std::unique_ptr<const Expression> left;
        std::unique_ptr<const Expression> right;
    };

    using Node = std::variant<Number, Variable, Binary>;

    // Неявные преобразования "сырых" операндов в листья:
    // числа становятся Number, строки становятся Variable
    template <std::integral T>
        requires (!std::same_as<T, bool>)
    Expression(T value) : Expression(Numeric(value)) {}
    template <std::floating_point T>
    Expression(T value) : Expression(Numeric(value)) {}
    Expression(Numeric value);
    Expression(std::string name);
    Expression(const char* name) : Expression(std::string(name)) {}

    Expression(BinaryOp op, Expression left, Expression right);

    Expression(const Expression& other);
    Expression(Expression&& other) noexcept = default;
    Expression& operator=(const Expression& other);
    Expression& operator=(Expression&& other) noexcept = default;
    ~Expression() = default;

    ExpressionKind kind() const;
    bool isNumber() const { return kind() == ExpressionKind::Number; }
    bool isVariable() const { return kind() == ExpressionKind::Variable; }
    bool isBinary() const { return kind() == ExpressionKind::Binary; }

    // Доступ к содержимому узла. Выбрасывают std::logic_error,
    // если узел другого вида.
    const Numeric& numberValue() const;
    const std::string& variableName() const;
    BinaryOp op() const;
    const Expression& left() const;
    const Expression& right() const;

    const Node& node() const { return node_; }

    // Приоритет для расстановки скобок при печати
    int precedence() const;

    // Инфиксная запись с минимумом скобок: "x * (2 + 3)"
    std::string render() const;

    // Полностью скобочная запись, которую принимает парсер: "(x * (2 + 3))"
    std::string toSource() const;

    // Отладочная запись в виде конструкторов: "Mul(Var('x'), Num(5))"
    std::string repr() const;

    // Вычисление значения.
    // UndefinedVariable - переменная отсутствует в bindings,
    // ArithmeticError - деление на ноль и недопустимые степени.
    double eval(const Bindings& bindings) const;

    // Символьная производная по переменной (без упрощения).
    // NotConstantExponent - показатель степени не числовой литерал.
    Expression deriv(const std::string& variable) const;

    // Рекурсивное упрощение. Идемпотентно, всегда успешно.
    Expression simplify() const;

    // Структурное равенство: x + 0 никогда не равно x
    bool equals(const Expression& other) const;

    // Имена всех переменных выражения в порядке сортировки
    std::set<std::string> collectVariables() const;

private:
    Node node_;
};

bool operator==(const Expression& lhs, const Expression& rhs);
bool operator!=(const Expression& lhs, const Expression& rhs);

// Печатает render()
std::ostream& operator<<(std::ostream& stream, const Expression& expression);

// Конструкторы бинарных узлов. Порядок операндов сохраняется: sub(a, b) == Sub(a, b).
Expression add(Expression lhs, Expression rhs);
Expression sub(Expression lhs, Expression rhs);
Expression mul(Expression lhs, Expression rhs);
Expression div(Expression lhs, Expression rhs);
Expression pow(Expression base, Expression exponent);

Expression operator+(Expression lhs, Expression rhs);
Expression operator-(Expression lhs, Expression rhs);
Expression operator*(Expression lhs, Expression rhs);
Expression operator/(Expression lhs, Expression rhs);

} // namespace symalg
