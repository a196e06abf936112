#pragma once

#include <map>
#include <string>
#include <vector>

#include "line_processor.hpp"

namespace linecalc {

// Итоговый отчет одного запуска
struct SessionReport {
    std::vector<LineOutcome> outcomes;        // Результаты непустых строк по порядку
    std::map<std::string, Value> usedVariables; // Присвоенные переменные и их итоговые значения
    std::vector<std::string> errors;          // Ошибки всех строк по порядку

    bool hasErrors() const { return !errors.empty(); }
};

// Разбиение текста на строки: \n, \r\n и одиночный \r завершают строку
std::vector<std::string> splitLines(const std::string& text);

// Драйвер сессии. Каждый вызов run() начинается с пустого хранилища
// переменных, поэтому повторный запуск на том же тексте дает тот же отчет.
// Строки обрабатываются строго последовательно: строка N может
// использовать переменные, присвоенные в строках до нее.
class Session {
public:
    Session() = default;

    SessionReport run(const std::string& sourceText) const;
};

} // namespace linecalc
