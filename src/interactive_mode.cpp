#include "symalg/modes.hpp"
#include "symalg/console.hpp"
#include "symalg/errors.hpp"
#include "symalg/repl_session.hpp"

#include <iostream>
#include <string>

void runInteractiveMode() {
    printHeader();
    std::cout << Color::GRAY << "Введите help для списка команд, quit для выхода.\n" << Color::RESET << "\n";

    symalg::ReplSession session;
    std::string line;

    while (!session.finished()) {
        std::cout << Color::BOLD << Color::CYAN << "symalg> " << Color::RESET << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }

        try {
            std::string output = session.execute(line);
            if (!output.empty()) {
                std::cout << output << "\n";
            }
        }
        catch (const symalg::ParseError& ex) {
            printError(std::string("разбор: ") + ex.what());
        }
        catch (const std::exception& ex) {
            printError(ex.what());
        }
    }

    std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
}
