#include "symalg/csv_writer.hpp"

#include <iomanip>
#include <stdexcept>

namespace symalg {

CsvWriter::CsvWriter(std::filesystem::path path) : targetPath(std::move(path)) {
    stream.open(targetPath, std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + targetPath.string());
    }
    stream << std::setprecision(15);
    stream << "line,expression,status,rendered,simplified,derivative,value,message\n";
}

void CsvWriter::writeRecord(const AnalysisRecord& record) {
    stream << record.lineNumber << ','
           << quoteCsvField(record.expression) << ','
           << record.status << ','
           << quoteCsvField(record.rendered) << ','
           << quoteCsvField(record.simplified) << ','
           << quoteCsvField(record.derivative) << ',';

    // Пустое поле, если значение не вычислено
    if (record.value.has_value()) {
        stream << record.value.value();
    }
    stream << ',' << quoteCsvField(record.message) << '\n';

    if (!stream) {
        throw std::runtime_error("Ошибка записи в CSV: " + targetPath.string());
    }
}

void CsvWriter::write(const std::vector<AnalysisRecord>& records) {
    for (const auto& record : records) {
        writeRecord(record);
    }
}

void CsvWriter::flush() {
    stream.flush();
    if (!stream) {
        throw std::runtime_error("Ошибка записи в CSV: " + targetPath.string());
    }
}

std::string quoteCsvField(const std::string& field) {
    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted.push_back('"');
    for (char ch : field) {
        if (ch == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

} // namespace symalg
