#include "session.hpp"

namespace linecalc {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char ch = text[i];
        if (ch == '\n' || ch == '\r') {
            lines.push_back(std::move(current));
            current.clear();
            if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            current.push_back(ch);
        }
    }
    // Последняя строка без перевода строки
    if (!current.empty()) {
        lines.push_back(std::move(current));
    }
    return lines;
}

SessionReport Session::run(const std::string& sourceText) const {
    SessionState state;
    LineProcessor processor(state);
    SessionReport report;

    auto lines = splitLines(sourceText);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (auto outcome = processor.process(i + 1, lines[i])) {
            report.outcomes.push_back(std::move(*outcome));
        }
    }

    for (const auto& name : state.usedVariables) {
        report.usedVariables[name] = state.variables.at(name);
    }
    report.errors = std::move(state.errors);
    return report;
}

} // namespace linecalc
