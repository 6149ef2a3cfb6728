#include "symalg/user_input.hpp"
#include "symalg/console.hpp"
#include "symalg/file_utils.hpp"
#include "symalg/numeric.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {
// Вывод подсказки и чтение строки без пробелов по краям
std::string prompt(const std::string& text) {
    std::cout << Color::BOLD << text << Color::RESET;
    std::string input;
    if (!std::getline(std::cin, input)) {
        throw std::runtime_error("Ввод прерван");
    }
    return trim(input);
}

// Выбор между именем по умолчанию (1) и своим (2)
bool askCustomName(const std::string& defaultDescription) {
    std::cout << Color::BOLD << "Выберите способ задания имени файла:\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". " << defaultDescription << "\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". Кастомное название\n\n";

    std::string choice = prompt("Ваш выбор (1 или 2): ");
    if (choice == "1") {
        return false;
    }
    if (choice == "2") {
        return true;
    }
    throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
}

std::filesystem::path withExtension(std::filesystem::path path, const std::string& extension) {
    if (path.extension() != extension) {
        path.replace_extension(extension);
    }
    return path;
}
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

std::size_t parseNumber(const std::string& value) {
    // stoul молча принимает знак минус
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
        throw std::runtime_error("Некорректное числовое значение: '" + value + "'");
    }
    std::size_t result = 0;
    try {
        std::size_t consumed = 0;
        result = std::stoul(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    }
    catch (const std::exception&) {
        throw std::runtime_error("Некорректное числовое значение: '" + value + "'");
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

symalg::Bindings parseBindings(const std::string& text) {
    symalg::Bindings bindings;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            continue;
        }
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("Ожидалось имя=значение, получено: '" + item + "'");
        }
        std::string name = trim(item.substr(0, eq));
        std::string valueText = trim(item.substr(eq + 1));
        auto value = symalg::Numeric::parse(valueText);
        if (name.empty() || !value) {
            throw std::runtime_error("Некорректная пара имя=значение: '" + item + "'");
        }
        // Такое имя не может встретиться в выражении
        if (name.find_first_of(" \t()") != std::string::npos) {
            throw std::runtime_error("Имя переменной не может содержать пробелы и скобки: '" + name + "'");
        }
        bindings[name] = value->asDouble();
    }
    return bindings;
}

std::filesystem::path selectInputFile() {
    std::filesystem::path dataDir = dataDirectory();
    auto txtFiles = findFilesWithExtension(dataDir, ".txt");

    if (txtFiles.empty()) {
        std::cout << Color::YELLOW << "Внимание: " << Color::RESET
            << "не найдено .txt файлов в " << Color::CYAN << dataDir << Color::RESET << "\n\n";
    }
    else {
        std::cout << Color::BOLD << "Найденные .txt файлы в " << dataDir << ":\n" << Color::RESET;
        for (std::size_t i = 0; i < txtFiles.size(); ++i) {
            std::cout << "  " << Color::CYAN << (i + 1) << Color::RESET << ". "
                << Color::YELLOW << txtFiles[i].filename().string() << Color::RESET << "\n";
        }
        std::cout << "\n";
    }

    std::string input = prompt("Введите номер файла или путь до входного файла: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }

    bool isNumber = std::all_of(input.begin(), input.end(),
                                [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (isNumber && !txtFiles.empty()) {
        std::size_t index = parseNumber(input);
        if (index > txtFiles.size()) {
            throw std::runtime_error("Номер файла вне допустимого диапазона");
        }
        return txtFiles[index - 1];
    }

    std::filesystem::path inputPath = input;
    if (!std::filesystem::exists(inputPath)) {
        throw std::runtime_error("Файл не найден: " + inputPath.string());
    }
    return inputPath;
}

std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath) {
    if (!askCustomName("Название по умолчанию (имя входного файла + _results_ + время)")) {
        return inputPath.parent_path() /
            (inputPath.stem().string() + "_results_" + getCurrentTimeString() + ".csv");
    }

    std::string customName = prompt("Введите название выходного файла (расширение .csv добавится автоматически): ");
    if (customName.empty()) {
        throw std::runtime_error("Пустое название файла");
    }

    // Относительный путь считается от каталога входного файла
    std::filesystem::path customPath(customName);
    if (customPath.is_relative()) {
        customPath = inputPath.parent_path() / customPath;
    }
    return withExtension(customPath, ".csv");
}

std::size_t selectThreadCount() {
    std::size_t defaultThreads = std::thread::hardware_concurrency();
    if (defaultThreads == 0) {
        defaultThreads = 2;
    }

    std::string input = prompt("Введите количество потоков (по умолчанию: " +
                               std::to_string(defaultThreads) + "): ");
    if (input.empty()) {
        return defaultThreads;
    }
    return parseNumber(input);
}

std::string askVariable() {
    std::string input = prompt("Переменная дифференцирования (по умолчанию: x): ");
    if (input.empty()) {
        return "x";
    }
    if (input.find_first_of(" \t()") != std::string::npos) {
        throw std::runtime_error("Имя переменной не может содержать пробелы и скобки");
    }
    return input;
}

symalg::Bindings askBindings() {
    return parseBindings(prompt("Значения переменных (например: x=1, y=2; пусто - без вычисления): "));
}

bool askContinue() {
    std::string input = prompt("Обработать еще один файл? (y/n): ");
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return (input == "y" || input == "yes" || input == "д" || input == "да");
}

std::size_t askExpressionCount() {
    std::string input = prompt("Введите количество выражений для генерации: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }
    return parseNumber(input);
}

std::filesystem::path selectGeneratedFileName(std::size_t expressionCount) {
    std::string defaultName = "generate_" + std::to_string(expressionCount) + ".txt";
    if (!askCustomName("Автоматическое название (" + defaultName + ")")) {
        return std::filesystem::path(defaultName);
    }

    std::string customName = prompt("Введите название файла (расширение .txt добавится автоматически): ");
    if (customName.empty()) {
        throw std::runtime_error("Пустое название файла");
    }
    return withExtension(customName, ".txt");
}
