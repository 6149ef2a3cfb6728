#pragma once

#include <cstddef>
#include <string>

namespace symalg {

enum class TokenType {
    LParen, // (
    RParen, // )
    Word,   // Число, имя переменной или символ оператора
    End     // Конец входа
};

struct Token {
    TokenType type;
    std::string text;
    std::size_t position; // Смещение первого символа во входной строке
};

} // namespace symalg
