#include "symalg/parser.hpp"
#include "symalg/errors.hpp"
#include "symalg/tokenizer.hpp"

#include <utility>

namespace symalg {

Parser::Parser(std::vector<Token> tokenList, ParserOptions options)
    : tokens(std::move(tokenList)), options(options) {
    // Токенизатор всегда добавляет End; для вектора, собранного вручную,
    // добавляем его сами, чтобы peek() не выходил за границы
    if (tokens.empty() || tokens.back().type != TokenType::End) {
        std::size_t position = tokens.empty() ? 0 : tokens.back().position + tokens.back().text.size();
        tokens.push_back({TokenType::End, "", position});
    }
}

Expression Parser::parse() {
    current = 0;
    Expression result = parseExpression(0);
    if (options.rejectTrailingTokens && !isAtEnd()) {
        throw ParseError("Лишние токены после выражения: '" + peek().text + "'", peek().position);
    }
    return result;
}

const Token& Parser::peek() const {
    return tokens[current];
}

const Token& Parser::advance() {
    const Token& token = tokens[current];
    if (!isAtEnd()) {
        ++current;
    }
    return token;
}

bool Parser::isAtEnd() const {
    return tokens[current].type == TokenType::End;
}

// Грамматика: expr -> number | identifier | "(" expr operator expr ")" | "(" expr ")"
Expression Parser::parseExpression(std::size_t depth) {
    if (depth > options.maxDepth) {
        throw ParseError("Слишком глубокая вложенность скобок (предел " +
                             std::to_string(options.maxDepth) + ")",
                         peek().position);
    }

    const Token& token = advance();
    switch (token.type) {
    case TokenType::End:
        throw ParseError("Неожиданный конец выражения", token.position);
    case TokenType::RParen:
        throw ParseError("Неожиданная закрывающая скобка", token.position);
    case TokenType::Word:
        return parseLeaf(token);
    case TokenType::LParen:
        break;
    }

    Expression left = parseExpression(depth + 1);

    // Группирующие скобки вокруг одного выражения: "(x)"
    if (peek().type == TokenType::RParen) {
        advance();
        return left;
    }

    BinaryOp op = parseOperator();
    Expression right = parseExpression(depth + 1);

    if (options.requireClosingParen) {
        if (peek().type != TokenType::RParen) {
            throw ParseError("Ожидалась закрывающая скобка", peek().position);
        }
    }
    advance();

    return Expression(op, std::move(left), std::move(right));
}

// Число (сначала целое, затем вещественное) или имя переменной
Expression Parser::parseLeaf(const Token& token) {
    if (auto number = Numeric::parse(token.text)) {
        return Expression(*number);
    }
    return Expression(token.text);
}

BinaryOp Parser::parseOperator() {
    const Token& token = peek();
    if (token.type == TokenType::End) {
        throw ParseError("Ожидался оператор, но выражение закончилось", token.position);
    }
    auto op = operatorFromSymbol(token.text);
    if (token.type != TokenType::Word || !op) {
        throw UnknownOperator(token.text, token.position);
    }
    advance();
    return *op;
}

std::optional<BinaryOp> operatorFromSymbol(const std::string& symbol) {
    if (symbol == "+") {
        return BinaryOp::Add;
    }
    if (symbol == "-") {
        return BinaryOp::Sub;
    }
    if (symbol == "*") {
        return BinaryOp::Mul;
    }
    if (symbol == "/") {
        return BinaryOp::Div;
    }
    if (symbol == "**") {
        return BinaryOp::Pow;
    }
    return std::nullopt;
}

Expression parse(const std::string& text, ParserOptions options) {
    Tokenizer tokenizer(text);
    Parser parser(tokenizer.tokenize(), options);
    return parser.parse();
}

} // namespace symalg
