#include "symalg/ast.hpp"
#include "symalg/errors.hpp"

#include <stdexcept>
#include <utility>

namespace symalg {

namespace {
// Глубокая копия узла вместе с поддеревьями
Expression::Node copyNode(const Expression::Node& node) {
    if (const auto* binary = std::get_if<Expression::Binary>(&node)) {
        return Expression::Binary{binary->op,
                                  std::make_unique<const Expression>(*binary->left),
                                  std::make_unique<const Expression>(*binary->right)};
    }
    if (const auto* variable = std::get_if<Expression::Variable>(&node)) {
        return *variable;
    }
    return std::get<Expression::Number>(node);
}

// Нужны ли скобки вокруг потомка при печати родителя
bool needsParentheses(const Expression& child, const OperatorTraits& parent, bool wrapAtSamePrecedence) {
    if (child.precedence() < parent.precedence) {
        return true;
    }
    return child.precedence() == parent.precedence && wrapAtSamePrecedence;
}

const char* reprName(BinaryOp op) {
    switch (op) {
    case BinaryOp::Add:
        return "Add";
    case BinaryOp::Sub:
        return "Sub";
    case BinaryOp::Mul:
        return "Mul";
    case BinaryOp::Div:
        return "Div";
    case BinaryOp::Pow:
        return "Pow";
    }
    return "?";
}

void collectInto(const Expression& expression, std::set<std::string>& names) {
    switch (expression.kind()) {
    case ExpressionKind::Number:
        return;
    case ExpressionKind::Variable:
        names.insert(expression.variableName());
        return;
    case ExpressionKind::Binary:
        collectInto(expression.left(), names);
        collectInto(expression.right(), names);
        return;
    }
}
}

Expression::Expression(Numeric value) : node_(Number{value}) {}

Expression::Expression(std::string name) : node_(Variable{std::move(name)}) {}

Expression::Expression(BinaryOp op, Expression left, Expression right)
    : node_(Binary{op,
                   std::make_unique<const Expression>(std::move(left)),
                   std::make_unique<const Expression>(std::move(right))}) {}

Expression::Expression(const Expression& other) : node_(copyNode(other.node_)) {}

Expression& Expression::operator=(const Expression& other) {
    if (this != &other) {
        node_ = copyNode(other.node_);
    }
    return *this;
}

ExpressionKind Expression::kind() const {
    return static_cast<ExpressionKind>(node_.index());
}

const Numeric& Expression::numberValue() const {
    if (const auto* number = std::get_if<Number>(&node_)) {
        return number->value;
    }
    throw std::logic_error("Узел не является числом: " + repr());
}

const std::string& Expression::variableName() const {
    if (const auto* variable = std::get_if<Variable>(&node_)) {
        return variable->name;
    }
    throw std::logic_error("Узел не является переменной: " + repr());
}

BinaryOp Expression::op() const {
    if (const auto* binary = std::get_if<Binary>(&node_)) {
        return binary->op;
    }
    throw std::logic_error("Узел не является бинарной операцией: " + repr());
}

const Expression& Expression::left() const {
    if (const auto* binary = std::get_if<Binary>(&node_)) {
        return *binary->left;
    }
    throw std::logic_error("У листа нет левого операнда: " + repr());
}

const Expression& Expression::right() const {
    if (const auto* binary = std::get_if<Binary>(&node_)) {
        return *binary->right;
    }
    throw std::logic_error("У листа нет правого операнда: " + repr());
}

int Expression::precedence() const {
    if (const auto* binary = std::get_if<Binary>(&node_)) {
        return traitsOf(binary->op).precedence;
    }
    return kLeafPrecedence;
}

std::string Expression::render() const {
    switch (kind()) {
    case ExpressionKind::Number:
        return numberValue().toString();
    case ExpressionKind::Variable:
        return variableName();
    case ExpressionKind::Binary:
        break;
    }

    const OperatorTraits traits = traitsOf(op());
    std::string leftText = left().render();
    std::string rightText = right().render();
    if (needsParentheses(left(), traits, traits.wrapLeftAtSamePrecedence)) {
        leftText = "(" + leftText + ")";
    }
    if (needsParentheses(right(), traits, traits.wrapRightAtSamePrecedence)) {
        rightText = "(" + rightText + ")";
    }
    return leftText + " " + traits.symbol + " " + rightText;
}

std::string Expression::toSource() const {
    switch (kind()) {
    case ExpressionKind::Number:
        return numberValue().toString();
    case ExpressionKind::Variable:
        return variableName();
    case ExpressionKind::Binary:
        break;
    }
    return "(" + left().toSource() + " " + traitsOf(op()).symbol + " " + right().toSource() + ")";
}

std::string Expression::repr() const {
    switch (kind()) {
    case ExpressionKind::Number:
        return "Num(" + numberValue().toString() + ")";
    case ExpressionKind::Variable:
        return "Var('" + variableName() + "')";
    case ExpressionKind::Binary:
        break;
    }
    return std::string(reprName(op())) + "(" + left().repr() + ", " + right().repr() + ")";
}

double Expression::eval(const Bindings& bindings) const {
    switch (kind()) {
    case ExpressionKind::Number:
        return numberValue().asDouble();
    case ExpressionKind::Variable: {
        auto it = bindings.find(variableName());
        if (it == bindings.end()) {
            throw UndefinedVariable(variableName());
        }
        return it->second;
    }
    case ExpressionKind::Binary:
        break;
    }

    double leftValue = left().eval(bindings);
    double rightValue = right().eval(bindings);

    switch (op()) {
    case BinaryOp::Add:
        return leftValue + rightValue;
    case BinaryOp::Sub:
        return leftValue - rightValue;
    case BinaryOp::Mul:
        return leftValue * rightValue;
    case BinaryOp::Div:
        return checkedDivide(leftValue, rightValue);
    case BinaryOp::Pow:
        return checkedPower(leftValue, rightValue);
    }
    throw std::logic_error("Неизвестная бинарная операция");
}

bool Expression::equals(const Expression& other) const {
    if (kind() != other.kind()) {
        return false;
    }
    switch (kind()) {
    case ExpressionKind::Number:
        return numberValue() == other.numberValue();
    case ExpressionKind::Variable:
        return variableName() == other.variableName();
    case ExpressionKind::Binary:
        return op() == other.op() && left().equals(other.left()) && right().equals(other.right());
    }
    return false;
}

std::set<std::string> Expression::collectVariables() const {
    std::set<std::string> names;
    collectInto(*this, names);
    return names;
}

bool operator==(const Expression& lhs, const Expression& rhs) {
    return lhs.equals(rhs);
}

bool operator!=(const Expression& lhs, const Expression& rhs) {
    return !lhs.equals(rhs);
}

std::ostream& operator<<(std::ostream& stream, const Expression& expression) {
    return stream << expression.render();
}

Expression add(Expression lhs, Expression rhs) {
    return Expression(BinaryOp::Add, std::move(lhs), std::move(rhs));
}

Expression sub(Expression lhs, Expression rhs) {
    return Expression(BinaryOp::Sub, std::move(lhs), std::move(rhs));
}

Expression mul(Expression lhs, Expression rhs) {
    return Expression(BinaryOp::Mul, std::move(lhs), std::move(rhs));
}

Expression div(Expression lhs, Expression rhs) {
    return Expression(BinaryOp::Div, std::move(lhs), std::move(rhs));
}

Expression pow(Expression base, Expression exponent) {
    return Expression(BinaryOp::Pow, std::move(base), std::move(exponent));
}

Expression operator+(Expression lhs, Expression rhs) {
    return add(std::move(lhs), std::move(rhs));
}

Expression operator-(Expression lhs, Expression rhs) {
    return sub(std::move(lhs), std::move(rhs));
}

Expression operator*(Expression lhs, Expression rhs) {
    return mul(std::move(lhs), std::move(rhs));
}

Expression operator/(Expression lhs, Expression rhs) {
    return div(std::move(lhs), std::move(rhs));
}

} // namespace symalg
