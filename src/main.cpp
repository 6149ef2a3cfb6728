#include "symalg/console.hpp"
#include "symalg/modes.hpp"

#include <iostream>
#include <string>

namespace {
void printUsage(const char* program) {
    std::cout << "Использование: " << program << " [repl|batch|generate]\n"
              << "  repl      интерактивный режим (по умолчанию)\n"
              << "  batch     обработка файла выражений с записью в CSV\n"
              << "  generate  генерация файла со случайными выражениями\n";
}
}

// Точка входа в программу
int main(int argc, char** argv) {
    std::string mode = argc >= 2 ? argv[1] : "repl";

    try {
        if (mode == "repl") {
            runInteractiveMode();
        }
        else if (mode == "batch") {
            runBatchMode();
        }
        else if (mode == "generate") {
            runGenerateMode();
        }
        else if (mode == "help" || mode == "--help" || mode == "-h") {
            printUsage(argv[0]);
        }
        else {
            printUsage(argv[0]);
            return 1;
        }
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        return 1;
    }
    return 0;
}
