#include "symalg/modes.hpp"
#include "symalg/console.hpp"
#include "symalg/expression_generator.hpp"
#include "symalg/file_utils.hpp"
#include "symalg/user_input.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

void runGenerateMode() {
    printHeader();

    std::cout << Color::BOLD << Color::CYAN << "Режим генерации выражений\n" << Color::RESET << "\n";

    // 1. Количество выражений и имя файла
    std::size_t expressionCount = askExpressionCount();
    std::filesystem::path fileName = selectGeneratedFileName(expressionCount);

    // 2. Файлы кладутся в tests/data, где их находит пакетный режим
    std::filesystem::path dataDir = dataDirectory();
    std::filesystem::create_directories(dataDir);
    std::filesystem::path outputPath = fileName.is_absolute() ? fileName : dataDir / fileName;

    std::cout << "\n";
    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Количество выражений: " << Color::CYAN << expressionCount << Color::RESET << "\n";
    std::cout << "  Выходной файл:        " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

    // 3. Генерация: глубина от 2 до 6, изредка с синтаксическими ошибками
    std::cout << Color::BOLD << "Генерация выражений..." << Color::RESET << std::flush;
    auto startGen = std::chrono::steady_clock::now();

    symalg::GeneratorConfig config;
    config.errorProbability = 0.05;
    symalg::ExpressionGenerator generator(config);

    std::ofstream output(outputPath);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл: " + outputPath.string());
    }

    for (std::size_t i = 0; i < expressionCount; ++i) {
        output << generator.generateText(2 + static_cast<int>(i % 5)) << "\n";

        if ((i + 1) % 10000 == 0) {
            std::cout << "\r  " << Color::CYAN << (i + 1) << "/" << expressionCount
                << " выражений сгенерировано..." << Color::RESET << std::flush;
        }
    }

    output.close();
    if (!output) {
        throw std::runtime_error("Ошибка записи в файл: " + outputPath.string());
    }

    auto genDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startGen);

    std::cout << "\r  " << Color::GREEN << "✓" << Color::RESET << " ("
        << expressionCount << " выражений, "
        << genDuration.count() << " мс)\n\n";

    std::cout << Color::GREEN << "Файл успешно создан: " << outputPath << Color::RESET << "\n\n";
}
