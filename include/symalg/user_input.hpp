#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "symalg/ast.hpp"

// Удаление пробелов и табуляций по краям
std::string trim(const std::string& text);

// Безопасный парсинг положительного целого из строки
std::size_t parseNumber(const std::string& value);

// Разбор таблицы значений вида "x=1, y=2.5".
// Пустая строка даёт пустую таблицу; ошибки формата - std::runtime_error.
symalg::Bindings parseBindings(const std::string& text);

// Интерактивный выбор входного файла
std::filesystem::path selectInputFile();

// Интерактивный выбор выходного файла
std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath);

// Интерактивный ввод количества потоков
std::size_t selectThreadCount();

// Переменная, по которой строится производная (по умолчанию x)
std::string askVariable();

// Значения переменных для вычисления
symalg::Bindings askBindings();

// Запрос продолжения работы с другим файлом
bool askContinue();

// Интерактивный ввод количества выражений для генерации
std::size_t askExpressionCount();

// Интерактивный выбор имени файла для генерации
std::filesystem::path selectGeneratedFileName(std::size_t expressionCount);
