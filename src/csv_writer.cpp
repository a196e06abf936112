#include "csv_writer.hpp"

#include <stdexcept>

namespace linecalc {

namespace {
// Экранирование поля: замена двойных кавычек на одинарные и оборачивание в кавычки
std::string quoted(std::string text) {
    for (char& ch : text) {
        if (ch == '"') {
            ch = '\'';
        }
    }
    return '"' + text + '"';
}
}

CsvWriter::CsvWriter(std::filesystem::path targetPath) : path(std::move(targetPath)) {
    initialize();
}

// Инициализация файла (запись заголовка)
void CsvWriter::initialize() const {
    std::ofstream stream(path, std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    stream << "line,expression,variable,postfix,status,result,message\n";
}

void CsvWriter::writeRow(std::ostream& stream, const LineOutcome& outcome) {
    stream << outcome.lineNumber << ',';
    stream << quoted(outcome.text) << ',';
    stream << outcome.target.value_or("") << ',';
    stream << quoted(outcome.postfixText()) << ',';
    stream << (outcome.succeeded() ? "success" : "error") << ',';

    // Числовое значение пишется только при успехе
    if (outcome.value.has_value()) {
        stream << *outcome.value;
    }
    stream << ',';

    stream << quoted(outcome.error ? outcome.error->message : "") << '\n';
}

void CsvWriter::write(const std::vector<LineOutcome>& outcomes) const {
    std::ofstream stream(path, std::ios::app);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    for (const auto& outcome : outcomes) {
        writeRow(stream, outcome);
    }
}

} // namespace linecalc
