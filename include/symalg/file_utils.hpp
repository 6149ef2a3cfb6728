#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Количество строк в файле (последняя строка без '\n' тоже считается)
std::size_t countLinesInFile(const std::filesystem::path& path);

// Корень проекта: ближайший каталог вверх от текущего, содержащий
// tests/ или CMakeLists.txt; иначе текущий каталог
std::filesystem::path findProjectRoot();

// Каталог с входными файлами выражений (tests/data в корне проекта)
std::filesystem::path dataDirectory();

// Файлы с заданным расширением в каталоге, отсортированные по имени.
// Расширение сравнивается без учёта регистра.
std::vector<std::filesystem::path> findFilesWithExtension(const std::filesystem::path& directory,
                                                          const std::string& extension);

// Текущее время в формате для имени файла: 20240131_235959
std::string getCurrentTimeString();
