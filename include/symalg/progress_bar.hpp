#pragma once

#include <atomic>
#include <cstddef>

// Отображение прогресс-бара. Запускается в отдельном потоке и работает,
// пока completed < total и не выставлен флаг cancelled.
void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total,
                     const std::atomic<bool>& cancelled);
