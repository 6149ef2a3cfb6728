#include "symalg/ast.hpp"

#include <stdexcept>
#include <utility>

namespace symalg {

namespace {
bool isNumberZero(const Expression& expression) {
    return expression.isNumber() && expression.numberValue().isZero();
}

bool isNumberOne(const Expression& expression) {
    return expression.isNumber() && expression.numberValue().isOne();
}

bool bothNumbers(const Expression& lhs, const Expression& rhs) {
    return lhs.isNumber() && rhs.isNumber();
}

// Свёртка двух чисел; если арифметика отказалась, узел пересобирается
Expression foldOrRebuild(BinaryOp op, Expression lhs, Expression rhs) {
    if (bothNumbers(lhs, rhs)) {
        std::optional<Numeric> folded;
        switch (op) {
        case BinaryOp::Add:
            folded = foldAdd(lhs.numberValue(), rhs.numberValue());
            break;
        case BinaryOp::Sub:
            folded = foldSub(lhs.numberValue(), rhs.numberValue());
            break;
        case BinaryOp::Mul:
            folded = foldMul(lhs.numberValue(), rhs.numberValue());
            break;
        case BinaryOp::Div:
            folded = foldDiv(lhs.numberValue(), rhs.numberValue());
            break;
        case BinaryOp::Pow:
            folded = foldPow(lhs.numberValue(), rhs.numberValue());
            break;
        }
        if (folded) {
            return Expression(*folded);
        }
    }
    return Expression(op, std::move(lhs), std::move(rhs));
}
}

// Правила применяются после упрощения обоих потомков.
// Порядок проверок внутри каждой операции значим (например, 0 ** 0 -> 1).
Expression Expression::simplify() const {
    if (!isBinary()) {
        return *this;
    }

    Expression lhs = left().simplify();
    Expression rhs = right().simplify();

    switch (op()) {
    case BinaryOp::Add:
        if (isNumberZero(lhs)) {
            return rhs;
        }
        if (isNumberZero(rhs)) {
            return lhs;
        }
        return foldOrRebuild(BinaryOp::Add, std::move(lhs), std::move(rhs));

    case BinaryOp::Sub:
        // 0 - x не упрощается: унарного минуса нет
        if (isNumberZero(rhs)) {
            return lhs;
        }
        return foldOrRebuild(BinaryOp::Sub, std::move(lhs), std::move(rhs));

    case BinaryOp::Mul:
        // Ноль поглощает до проверки единицы
        if (isNumberZero(lhs) || isNumberZero(rhs)) {
            return Expression(0);
        }
        if (isNumberOne(lhs)) {
            return rhs;
        }
        if (isNumberOne(rhs)) {
            return lhs;
        }
        return foldOrRebuild(BinaryOp::Mul, std::move(lhs), std::move(rhs));

    case BinaryOp::Div:
        // 0 / x -> 0 без проверки знаменателя
        if (isNumberZero(lhs)) {
            return Expression(0);
        }
        if (isNumberOne(rhs)) {
            return lhs;
        }
        return foldOrRebuild(BinaryOp::Div, std::move(lhs), std::move(rhs));

    case BinaryOp::Pow:
        if (isNumberZero(rhs)) {
            return Expression(1);
        }
        if (isNumberOne(rhs)) {
            return lhs;
        }
        if (isNumberZero(lhs)) {
            return Expression(0);
        }
        return foldOrRebuild(BinaryOp::Pow, std::move(lhs), std::move(rhs));
    }
    throw std::logic_error("Неизвестная бинарная операция");
}

} // namespace symalg
