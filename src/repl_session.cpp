#include "symalg/repl_session.hpp"
#include "symalg/numeric.hpp"

#include <iomanip>
#include <map>
#include <utility>
#include <sstream>
#include <stdexcept>

namespace symalg {

namespace {
// Отделяет первое слово строки от остатка
std::pair<std::string, std::string> splitWord(const std::string& text) {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {"", ""};
    }
    auto end = text.find_first_of(" \t", begin);
    if (end == std::string::npos) {
        return {text.substr(begin), ""};
    }
    auto rest = text.find_first_not_of(" \t", end);
    return {text.substr(begin, end - begin), rest == std::string::npos ? "" : text.substr(rest)};
}

void requireArgument(const std::string& command, const std::string& argument) {
    if (argument.empty()) {
        throw std::runtime_error("Команде '" + command + "' нужен аргумент");
    }
}
}

ReplSession::ReplSession(ParserOptions options) : options(options) {}

std::string ReplSession::execute(const std::string& line) {
    auto [command, rest] = splitWord(line);

    if (command.empty()) {
        return "";
    }
    if (command == "quit" || command == "exit") {
        done = true;
        return "";
    }
    if (command == "help") {
        return replHelp();
    }
    if (command == "bindings") {
        return listBindings();
    }
    if (command == "let") {
        return letCommand(rest);
    }
    if (command == "unset") {
        requireArgument(command, rest);
        if (variables.erase(rest) == 0) {
            throw std::runtime_error("Переменная '" + rest + "' не задана");
        }
        return rest + " удалена";
    }
    if (command == "render") {
        return parseArgument(rest).render();
    }
    if (command == "simplify") {
        return parseArgument(rest).simplify().render();
    }
    if (command == "repr") {
        return parseArgument(rest).repr();
    }
    if (command == "source") {
        return parseArgument(rest).toSource();
    }
    if (command == "eval") {
        return formatValue(parseArgument(rest).eval(variables));
    }
    if (command == "vars") {
        std::string names;
        for (const auto& name : parseArgument(rest).collectVariables()) {
            names += names.empty() ? name : " " + name;
        }
        return names;
    }
    if (command == "deriv") {
        auto [variable, expressionText] = splitWord(rest);
        requireArgument(command, variable);
        return parseArgument(expressionText).deriv(variable).simplify().render();
    }

    // Не команда: вся строка - выражение
    return describe(parse(line, options));
}

Expression ReplSession::parseArgument(const std::string& text) const {
    if (text.empty()) {
        throw std::runtime_error("Ожидалось выражение");
    }
    return parse(text, options);
}

std::string ReplSession::describe(const Expression& expression) const {
    std::ostringstream out;
    out << "запись:    " << expression.render() << "\n"
        << "упрощение: " << expression.simplify().render() << "\n"
        << "дерево:    " << expression.repr();
    return out.str();
}

// let x 4 | let x = 4
std::string ReplSession::letCommand(const std::string& arguments) {
    auto [name, rest] = splitWord(arguments);
    requireArgument("let", name);

    auto eq = name.find('=');
    if (eq != std::string::npos) {
        // let x=4
        rest = name.substr(eq + 1) + rest;
        name = name.substr(0, eq);
    } else if (!rest.empty() && rest.front() == '=') {
        rest = rest.substr(1);
    }

    auto [valueText, extra] = splitWord(rest);
    auto value = Numeric::parse(valueText);
    if (name.empty() || !value || !extra.empty()) {
        throw std::runtime_error("Ожидалось: let <имя> <число>");
    }
    variables[name] = value->asDouble();
    return name + " = " + formatValue(variables[name]);
}

std::string ReplSession::listBindings() const {
    if (variables.empty()) {
        return "(нет переменных)";
    }
    // Упорядочиваем для стабильного вывода
    std::map<std::string, double> sorted(variables.begin(), variables.end());
    std::string result;
    for (const auto& [name, value] : sorted) {
        if (!result.empty()) {
            result += "\n";
        }
        result += name + " = " + formatValue(value);
    }
    return result;
}

std::string replHelp() {
    return "Выражения записываются с полной расстановкой скобок: (x * (2 + 3))\n"
           "  render <expr>          инфиксная запись\n"
           "  simplify <expr>        упрощение\n"
           "  deriv <var> <expr>     производная\n"
           "  eval <expr>            значение при текущих переменных\n"
           "  repr <expr>            дерево\n"
           "  source <expr>          полностью скобочная запись\n"
           "  vars <expr>            переменные выражения\n"
           "  let <name> <value>     задать переменную\n"
           "  unset <name>           удалить переменную\n"
           "  bindings               текущие значения\n"
           "  quit                   выход";
}

std::string formatValue(double value) {
    std::ostringstream out;
    out << std::setprecision(15) << value;
    return out.str();
}

} // namespace symalg
