#pragma once

#include <string>
#include <vector>

#include "symalg/token.hpp"

namespace symalg {

// Лексический анализатор полностью скобочной записи.
// Скобки всегда отдельные токены, остальной текст делится по пробельным
// символам. Кавычек, экранирования и комментариев нет.
class Tokenizer {
public:
    explicit Tokenizer(std::string sourceText);

    // Возвращает вектор токенов, заканчивающийся токеном End.
    // Не выбрасывает исключений: любой непробельный символ допустим.
    std::vector<Token> tokenize();

private:
    const std::string source;
    std::size_t index = 0;

    bool isAtEnd() const;
    char peek() const;
    char advance();
    void skipWhitespace();

    // Считывает слово до пробела или скобки
    Token makeWord();
};

} // namespace symalg
