#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "symalg/ast.hpp"
#include "symalg/token.hpp"

namespace symalg {

// Настройки строгости разбора
struct ParserOptions {
    // Требовать ')' после правого операнда. Если false, токен на этом
    // месте пропускается без проверки.
    bool requireClosingParen = true;

    // Отвергать токены после первого полного выражения.
    // По умолчанию хвост молча игнорируется.
    bool rejectTrailingTokens = false;

    // Предельная вложенность скобок; глубже - ParseError вместо
    // переполнения стека
    std::size_t maxDepth = 4096;
};

// Синтаксический анализатор полностью скобочной записи:
//   expr     := number | identifier | "(" expr operator expr ")" | "(" expr ")"
//   operator := "+" | "-" | "*" | "/" | "**"
// Рекурсивный спуск с явным курсором, без приоритетов операций.
class Parser {
public:
    explicit Parser(std::vector<Token> tokenList, ParserOptions options = {});

    // Разбирает выражение, начиная с первого токена.
    // Выбрасывает ParseError (UnknownOperator) при ошибке; частичное
    // дерево никогда не возвращается.
    Expression parse();

private:
    std::vector<Token> tokens;
    const ParserOptions options;
    std::size_t current = 0;

    const Token& peek() const;
    const Token& advance();
    bool isAtEnd() const;

    Expression parseExpression(std::size_t depth);
    Expression parseLeaf(const Token& token);
    BinaryOp parseOperator();
};

// Символ оператора в BinaryOp; nullopt для неизвестных символов
std::optional<BinaryOp> operatorFromSymbol(const std::string& symbol);

// Токенизация и разбор строки
Expression parse(const std::string& text, ParserOptions options = {});

} // namespace symalg
