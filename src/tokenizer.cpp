#include "symalg/tokenizer.hpp"

#include <cctype>

namespace symalg {

namespace {
bool isDelimiter(char ch) {
    return ch == '(' || ch == ')' || std::isspace(static_cast<unsigned char>(ch));
}
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) {
            break;
        }

        switch (peek()) {
        case '(':
            tokens.push_back({TokenType::LParen, "(", index});
            advance();
            break;
        case ')':
            tokens.push_back({TokenType::RParen, ")", index});
            advance();
            break;
        default:
            tokens.push_back(makeWord());
            break;
        }
    }

    tokens.push_back({TokenType::End, "", index});
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::advance() {
    return source[index++];
}

void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

Token Tokenizer::makeWord() {
    std::size_t start = index;
    while (!isAtEnd() && !isDelimiter(peek())) {
        advance();
    }
    return {TokenType::Word, source.substr(start, index - start), start};
}

} // namespace symalg
