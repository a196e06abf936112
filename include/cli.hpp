#pragma once

#include <chrono>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "session.hpp"

namespace linecalc {

// Параметры запуска из командной строки
struct CliOptions {
    std::optional<std::string> inputPath;         // Путь к программе или "-" для stdin
    std::optional<std::filesystem::path> csvPath; // Куда сохранить CSV
    bool showHelp = false;
};

// Разбор аргументов (без имени программы).
// Выбрасывает std::runtime_error при неизвестном параметре, втором входном
// файле или --csv без входного файла.
CliOptions parseArguments(const std::vector<std::string>& args);

// Пустой или состоящий из пробелов ввод - ошибка использования
void requireProgramText(const std::string& text);

void exportCsv(const std::filesystem::path& path, const SessionReport& report);

// Блок статистики: строки, успехи, ошибки, переменные, время
void printStatistics(std::ostream& out, const SessionReport& report, std::chrono::milliseconds duration);

// Пакетный режим: программа из файла или из input ("-"), отчет в out,
// статистика и ошибки оболочки в err.
// Возвращает код завершения: 0 после обработки (ошибки строк - это данные),
// 1 если ввод не прочитан, пуст или CSV не записан.
int runBatch(const CliOptions& options, std::istream& input, std::ostream& out, std::ostream& err);

} // namespace linecalc
