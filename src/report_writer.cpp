#include "report_writer.hpp"

#include <sstream>

namespace linecalc {

namespace {
constexpr const char* kSeparator = "-------------------------------------------\n";
}

void writeReport(std::ostream& out, const SessionReport& report, const std::string& sourceText) {
    out << "Input lines:\n" << sourceText << "\n\nOutput:\n";

    for (const auto& outcome : report.outcomes) {
        out << "Line " << outcome.lineNumber << ": " << outcome.text << "\n";
        out << "Postfix: " << outcome.postfixText() << "\n";
        out << "Result: " << outcome.resultText() << "\n\n";
    }

    out << kSeparator << "Variables used:\n";
    if (report.usedVariables.empty()) {
        out << "No variables were used\n";
    } else {
        for (const auto& [name, value] : report.usedVariables) {
            out << name << " = " << value << "\n";
        }
    }

    out << kSeparator << "Errors found:\n";
    if (report.errors.empty()) {
        out << "No errors detected\n";
    } else {
        for (const auto& error : report.errors) {
            out << error << "\n";
        }
    }
}

std::string renderReport(const SessionReport& report, const std::string& sourceText) {
    std::ostringstream oss;
    writeReport(oss, report, sourceText);
    return oss.str();
}

} // namespace linecalc
