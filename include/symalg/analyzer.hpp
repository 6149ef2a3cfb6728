#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "symalg/ast.hpp"
#include "symalg/parser.hpp"

namespace symalg {

// Результат обработки одной строки входа.
// Поля заполняются по мере успешного прохождения этапов;
// message содержит первую ошибку.
struct AnalysisRecord {
    std::size_t lineNumber = 0;
    std::string expression;          // Исходный текст
    std::string status;              // success или error
    std::string rendered;            // Инфиксная запись
    std::string simplified;          // Упрощённое выражение
    std::string derivative;          // Упрощённая производная
    std::optional<double> value;     // Значение при заданных переменных
    std::string message;             // Текст первой ошибки

    bool succeeded() const { return status == "success"; }
};

// Фасад полного цикла обработки выражения:
// разбор -> печать -> упрощение -> производная -> вычисление.
class ExpressionAnalyzer {
public:
    ExpressionAnalyzer() = default;
    ExpressionAnalyzer(std::string variable, Bindings bindings, ParserOptions options = {});

    // Никогда не выбрасывает ошибок библиотеки: они попадают в record.message
    AnalysisRecord analyze(const std::string& text, std::size_t lineNumber = 0) const;

    const std::string& variable() const { return variable_; }
    const Bindings& bindings() const { return bindings_; }

private:
    std::string variable_ = "x";
    Bindings bindings_;
    ParserOptions options_;
};

} // namespace symalg
