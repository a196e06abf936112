#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

// Безопасный парсинг положительного числа из строки
std::size_t parseNumber(const std::string& value);

// Интерактивный выбор входного файла (номер из списка tests/ или путь)
std::filesystem::path selectInputFile();

// Интерактивный выбор CSV-файла для результатов; std::nullopt - без CSV
std::optional<std::filesystem::path> selectCsvOutput(const std::filesystem::path& inputPath);

// Запрос продолжения работы с другим файлом
bool askContinue();
