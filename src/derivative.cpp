#include "symalg/ast.hpp"
#include "symalg/errors.hpp"

#include <stdexcept>

namespace symalg {

// Производная строится структурно, без упрощения результата
Expression Expression::deriv(const std::string& variable) const {
    switch (kind()) {
    case ExpressionKind::Number:
        return Expression(0);
    case ExpressionKind::Variable:
        return Expression(variableName() == variable ? 1 : 0);
    case ExpressionKind::Binary:
        break;
    }

    const Expression& lhs = left();
    const Expression& rhs = right();

    switch (op()) {
    case BinaryOp::Add:
        return lhs.deriv(variable) + rhs.deriv(variable);
    case BinaryOp::Sub:
        return lhs.deriv(variable) - rhs.deriv(variable);
    case BinaryOp::Mul:
        // (uv)' = u v' + v u'
        return lhs * rhs.deriv(variable) + rhs * lhs.deriv(variable);
    case BinaryOp::Div:
        // (u/v)' = (v u' - u v') / (v v)
        return (rhs * lhs.deriv(variable) - lhs * rhs.deriv(variable)) / (rhs * rhs);
    case BinaryOp::Pow:
        // (u^n)' = n u^(n-1) u', только для числового n
        if (!rhs.isNumber()) {
            throw NotConstantExponent(rhs.render());
        }
        return rhs * pow(lhs, rhs - 1) * lhs.deriv(variable);
    }
    throw std::logic_error("Неизвестная бинарная операция");
}

} // namespace symalg
