#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

// Чтение всего текстового файла в строку
// Выбрасывает std::runtime_error, если файл не удалось открыть или прочитать
std::string readTextFile(const std::filesystem::path& path);

// Чтение всего потока (например, std::cin) в строку
std::string readStream(std::istream& input);

// Поиск корневой директории проекта (ищет папку tests или файл CMakeLists.txt)
std::filesystem::path findProjectRoot();

// Сравнение расширения файла без учета регистра
bool hasExtension(const std::filesystem::path& path, const std::string& ext);

// Поиск файлов с программами (.txt и .in) в директории
std::vector<std::filesystem::path> findProgramFiles(const std::filesystem::path& directory);

// Получение текущего времени в формате для имени файла
std::string getCurrentTimeString();
