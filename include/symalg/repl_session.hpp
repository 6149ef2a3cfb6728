#pragma once

#include <string>

#include "symalg/ast.hpp"
#include "symalg/parser.hpp"

namespace symalg {

// Состояние интерактивного режима: таблица значений переменных и разбор команд.
//
// Команды:
//   render <expr>          инфиксная запись
//   simplify <expr>        упрощение
//   deriv <var> <expr>     упрощённая производная
//   eval <expr>            значение при текущих переменных
//   repr <expr>            отладочная запись
//   source <expr>          полностью скобочная запись
//   vars <expr>            переменные выражения
//   let <name> [=] <value> задать переменную
//   unset <name>           удалить переменную
//   bindings               текущие значения
//   help, quit
// Строка без команды считается выражением и печатается целиком.
class ReplSession {
public:
    explicit ReplSession(ParserOptions options = {});

    // Выполняет одну строку и возвращает текст ответа.
    // Ошибки разбора и вычисления выбрасываются наружу (symalg::Error),
    // ошибки формата команды - std::runtime_error.
    std::string execute(const std::string& line);

    bool finished() const { return done; }
    const Bindings& bindings() const { return variables; }

private:
    ParserOptions options;
    Bindings variables;
    bool done = false;

    Expression parseArgument(const std::string& text) const;
    std::string describe(const Expression& expression) const;
    std::string letCommand(const std::string& arguments);
    std::string listBindings() const;
};

// Текст справки по командам
std::string replHelp();

// Форматирование значения для вывода: 20, 0.5, 1e+20
std::string formatValue(double value);

} // namespace symalg
