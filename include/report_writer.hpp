#pragma once

#include <ostream>
#include <string>

#include "session.hpp"

namespace linecalc {

// Текстовый отчет о сессии: исходный текст, затем по каждой строке
// постфикс и результат, затем список переменных и список ошибок.
void writeReport(std::ostream& out, const SessionReport& report, const std::string& sourceText);

std::string renderReport(const SessionReport& report, const std::string& sourceText);

} // namespace linecalc
