#include "symalg/analyzer.hpp"
#include "symalg/errors.hpp"

#include <utility>

namespace symalg {

ExpressionAnalyzer::ExpressionAnalyzer(std::string variable, Bindings bindings, ParserOptions options)
    : variable_(std::move(variable)), bindings_(std::move(bindings)), options_(options) {}

// Этапы выполняются по порядку. Ошибка разбора прерывает обработку,
// ошибки производной и вычисления только отмечаются: остальные поля
// остаются заполненными.
AnalysisRecord ExpressionAnalyzer::analyze(const std::string& text, std::size_t lineNumber) const {
    AnalysisRecord record;
    record.lineNumber = lineNumber;
    record.expression = text;
    record.status = "success";

    auto fail = [&record](const std::string& message) {
        if (record.message.empty()) {
            record.message = message;
        }
        record.status = "error";
    };

    // Этап 1: Разбор
    std::optional<Expression> tree;
    try {
        tree = parse(text, options_);
    }
    catch (const ParseError& ex) {
        fail(ex.what());
        return record;
    }

    // Этап 2: Печать и упрощение (всегда успешны)
    record.rendered = tree->render();
    record.simplified = tree->simplify().render();

    // Этап 3: Производная
    try {
        record.derivative = tree->deriv(variable_).simplify().render();
    }
    catch (const NotConstantExponent& ex) {
        fail(ex.what());
    }

    // Этап 4: Вычисление
    try {
        record.value = tree->eval(bindings_);
    }
    catch (const Error& ex) {
        fail(ex.what());
    }

    return record;
}

} // namespace symalg
