#include "symalg/batch_processor.hpp"

#include <fstream>
#include <future>
#include <stdexcept>
#include <string>

namespace symalg {

BatchStatistics processExpressionsStreaming(
    const std::filesystem::path& path,
    const ExpressionAnalyzer& analyzer,
    ThreadPool& pool,
    std::atomic<std::size_t>& completed,
    const std::function<void(const std::vector<AnalysisRecord>&)>& onBatch,
    BatchOptions options) {

    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + path.string());
    }
    if (options.chunkSize == 0 || options.batchSize == 0) {
        throw std::invalid_argument("Размеры порций должны быть положительными");
    }

    BatchStatistics statistics;
    std::vector<std::future<AnalysisRecord>> futures;
    futures.reserve(options.chunkSize);

    // Собирает результаты в порядке постановки задач
    auto drainFutures = [&]() {
        std::vector<AnalysisRecord> batch;
        batch.reserve(options.batchSize);
        for (auto& future : futures) {
            batch.push_back(future.get());
            const AnalysisRecord& record = batch.back();
            ++statistics.total;
            if (record.succeeded()) {
                ++statistics.succeeded;
            } else {
                ++statistics.failed;
            }
            if (batch.size() >= options.batchSize) {
                onBatch(batch);
                batch.clear();
            }
        }
        if (!batch.empty()) {
            onBatch(batch);
        }
        futures.clear();
    };

    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            completed.fetch_add(1);
            continue;
        }

        futures.push_back(pool.enqueue(
            [text = std::move(line), lineNumber, &analyzer, &completed]() {
                AnalysisRecord record = analyzer.analyze(text, lineNumber);
                completed.fetch_add(1);
                return record;
            }));
        line.clear();

        if (futures.size() >= options.chunkSize) {
            drainFutures();
        }
    }

    drainFutures();
    return statistics;
}

} // namespace symalg
