#pragma once

// Интерактивный режим: команды над выражениями построчно из std::cin
void runInteractiveMode();

// Пакетная обработка файла выражений с записью результатов в CSV
void runBatchMode();

// Генерация файла со случайными выражениями
void runGenerateMode();
