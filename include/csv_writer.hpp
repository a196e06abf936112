#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "line_processor.hpp"

namespace linecalc {

// Класс для записи результатов строк в формате CSV
// Формат: line,expression,variable,postfix,status,result,message
class CsvWriter {
public:
    // Конструктор создает файл (перезаписывая его) и пишет заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Записывает пакет результатов в файл
    void write(const std::vector<LineOutcome>& outcomes) const;

private:
    std::filesystem::path path; // Путь к выходному файлу

    void initialize() const;

    static void writeRow(std::ostream& stream, const LineOutcome& outcome);
};

} // namespace linecalc
