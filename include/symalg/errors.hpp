#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace symalg {

// Базовый класс всех ошибок библиотеки
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Ошибка разбора входного текста.
// Хранит позицию токена, на котором разбор остановился.
class ParseError : public Error {
public:
    ParseError(const std::string& message, std::size_t position)
        : Error(message + " (позиция " + std::to_string(position) + ")"), position_(position) {}

    std::size_t position() const { return position_; }

private:
    std::size_t position_;
};

// На месте оператора стоит токен, не входящий в набор + - * / **
class UnknownOperator final : public ParseError {
public:
    UnknownOperator(const std::string& symbol, std::size_t position)
        : ParseError("Неизвестный оператор '" + symbol + "'", position), symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

// Переменная отсутствует в таблице значений при вычислении
class UndefinedVariable final : public Error {
public:
    explicit UndefinedVariable(const std::string& name)
        : Error("Переменная '" + name + "' не определена"), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Дифференцирование степени, показатель которой не числовой литерал
class NotConstantExponent final : public Error {
public:
    explicit NotConstantExponent(const std::string& exponent)
        : Error("Показатель степени должен быть числом, получено: " + exponent) {}
};

// Деление на ноль, возведение нуля в отрицательную степень и т.п.
class ArithmeticError final : public Error {
public:
    explicit ArithmeticError(const std::string& message) : Error(message) {}
};

} // namespace symalg
