#include "symalg/modes.hpp"
#include "symalg/analyzer.hpp"
#include "symalg/batch_processor.hpp"
#include "symalg/console.hpp"
#include "symalg/csv_writer.hpp"
#include "symalg/file_utils.hpp"
#include "symalg/progress_bar.hpp"
#include "symalg/thread_pool.hpp"
#include "symalg/user_input.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <thread>
#include <vector>

namespace {
// Обработка одного файла от выбора до статистики
void processOneFile() {
    std::filesystem::path inputPath = selectInputFile();
    std::filesystem::path outputPath = selectOutputFile(inputPath);
    std::size_t threadCount = selectThreadCount();
    std::string variable = askVariable();
    symalg::Bindings bindings = askBindings();

    std::cout << "\n";
    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Входной файл:  " << Color::YELLOW << inputPath << Color::RESET << "\n";
    std::cout << "  Выходной файл: " << Color::YELLOW << outputPath << Color::RESET << "\n";
    std::cout << "  Потоков:       " << Color::CYAN << threadCount << Color::RESET << "\n";
    std::cout << "  Производная:   " << Color::CYAN << "d/d" << variable << Color::RESET << "\n";
    std::cout << "  Переменных:    " << Color::CYAN << bindings.size() << Color::RESET << "\n\n";

    // 0. Быстрый подсчет количества строк для прогресс-бара
    std::cout << Color::BOLD << "Подсчет строк в файле..." << Color::RESET << std::flush;
    std::size_t totalLines = countLinesInFile(inputPath);
    std::cout << " " << Color::GREEN << "✓" << Color::RESET << " (" << totalLines << " строк)\n\n";

    // 1. Потоковая обработка; результаты приходят по порядку строк
    std::cout << Color::BOLD << "Обработка выражений:\n" << Color::RESET;
    auto startProcess = std::chrono::steady_clock::now();

    symalg::ExpressionAnalyzer analyzer(variable, bindings);
    symalg::CsvWriter writer(outputPath);
    std::atomic<std::size_t> completed{0};
    std::atomic<bool> cancelled{false};

    std::thread progressThread(displayProgress, std::cref(completed), totalLines, std::cref(cancelled));

    symalg::BatchStatistics statistics;
    try {
        symalg::ThreadPool pool(threadCount);
        statistics = symalg::processExpressionsStreaming(
            inputPath, analyzer, pool, completed,
            [&writer](const std::vector<symalg::AnalysisRecord>& batch) { writer.write(batch); });
        writer.flush();
    }
    catch (...) {
        // Останавливаем прогресс-бар и передаём ошибку дальше
        cancelled = true;
        progressThread.join();
        throw;
    }
    cancelled = true;
    progressThread.join();

    auto processDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startProcess);

    // 2. Итоговая статистика
    std::cout << "\n" << Color::BOLD << "Статистика:\n" << Color::RESET;
    std::cout << "  Всего выражений:  " << Color::CYAN << statistics.total << Color::RESET << "\n";
    std::cout << "  Успешно:          " << Color::GREEN << statistics.succeeded << Color::RESET << "\n";
    if (statistics.failed > 0) {
        std::cout << "  Ошибок:           " << Color::RED << statistics.failed << Color::RESET << "\n";
    }
    std::cout << "  Время обработки:  " << Color::MAGENTA << processDuration.count()
        << " мс" << Color::RESET << "\n";
    if (processDuration.count() > 0) {
        std::cout << "  Производительность: " << Color::YELLOW
            << static_cast<long long>(statistics.total * 1000.0 / processDuration.count())
            << " выр/сек" << Color::RESET << "\n";
    }

    std::cout << "\n" << Color::GREEN << "Результаты сохранены в: " << outputPath << Color::RESET << "\n\n";
}
}

void runBatchMode() {
    printHeader();

    bool continueProcessing = true;
    while (continueProcessing) {
        try {
            processOneFile();
        }
        catch (const std::exception& ex) {
            std::cerr << "\n";
            printError(ex.what());
            std::cerr << "\n";
        }

        // И после ошибки спрашиваем, хочет ли пользователь продолжить
        try {
            continueProcessing = askContinue();
        }
        catch (const std::exception&) {
            continueProcessing = false;
        }
        if (continueProcessing) {
            std::cout << "\n";
        }
    }

    std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
}
