#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

#include "symalg/analyzer.hpp"
#include "symalg/thread_pool.hpp"

namespace symalg {

struct BatchOptions {
    std::size_t chunkSize = 10000; // Строк, читаемых из файла за раз
    std::size_t batchSize = 1000;  // Результатов, передаваемых в callback за раз
};

struct BatchStatistics {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
};

// Потоковая обработка файла выражений по частям.
// Строки читаются порциями и отправляются в пул потоков; результаты
// передаются в onBatch в порядке строк входного файла, поэтому файл
// любого размера обрабатывается без загрузки целиком в память.
// Пустые строки пропускаются, но сохраняют нумерацию.
BatchStatistics processExpressionsStreaming(
    const std::filesystem::path& path,
    const ExpressionAnalyzer& analyzer,
    ThreadPool& pool,
    std::atomic<std::size_t>& completed,
    const std::function<void(const std::vector<AnalysisRecord>&)>& onBatch,
    BatchOptions options = {});

} // namespace symalg
