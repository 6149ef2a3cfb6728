#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "symalg/analyzer.hpp"

namespace symalg {

// Запись результатов обработки в CSV.
// Заголовок: line,expression,status,rendered,simplified,derivative,value,message
// Текстовые поля берутся в кавычки, кавычки внутри удваиваются.
class CsvWriter {
public:
    // Открывает файл для записи (перезаписывая его) и пишет заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    void writeRecord(const AnalysisRecord& record);
    void write(const std::vector<AnalysisRecord>& records);

    // Сбрасывает буфер; выбрасывает std::runtime_error при ошибке записи
    void flush();

    const std::filesystem::path& path() const { return targetPath; }

private:
    std::filesystem::path targetPath;
    std::ofstream stream;
};

// Экранирование поля по правилам CSV
std::string quoteCsvField(const std::string& field);

} // namespace symalg
