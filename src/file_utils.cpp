#include "symalg/file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {
std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}
}

// Читает файл блоками и считает символы новой строки
std::size_t countLinesInFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для подсчета строк: " + path.string());
    }

    constexpr std::size_t bufferSize = 1024 * 1024;
    std::vector<char> buffer(bufferSize);
    std::size_t lineCount = 0;
    char lastChar = '\n';

    while (input.read(buffer.data(), bufferSize) || input.gcount() > 0) {
        auto bytesRead = static_cast<std::size_t>(input.gcount());
        lineCount += static_cast<std::size_t>(std::count(buffer.data(), buffer.data() + bytesRead, '\n'));
        lastChar = buffer[bytesRead - 1];
    }

    // Последняя строка без '\n'
    if (lastChar != '\n') {
        ++lineCount;
    }
    return lineCount;
}

std::filesystem::path findProjectRoot() {
    std::error_code error;
    std::filesystem::path current = std::filesystem::current_path(error);
    if (error) {
        return std::filesystem::path(".");
    }

    for (auto dir = current; !dir.empty(); dir = dir.parent_path()) {
        if (std::filesystem::is_directory(dir / "tests", error) ||
            std::filesystem::is_regular_file(dir / "CMakeLists.txt", error)) {
            return dir;
        }
        if (dir == dir.root_path()) {
            break;
        }
    }
    return current;
}

std::filesystem::path dataDirectory() {
    return findProjectRoot() / "tests" / "data";
}

std::vector<std::filesystem::path> findFilesWithExtension(const std::filesystem::path& directory,
                                                          const std::string& extension) {
    std::vector<std::filesystem::path> files;
    std::error_code error;
    if (!std::filesystem::is_directory(directory, error)) {
        return files;
    }

    const std::string wanted = toLower(extension);
    for (std::filesystem::directory_iterator it(directory, error), end; !error && it != end; it.increment(error)) {
        // Файлы, к которым нет доступа, пропускаются
        std::error_code entryError;
        if (it->is_regular_file(entryError) && toLower(it->path().extension().string()) == wanted) {
            files.push_back(it->path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string getCurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}
