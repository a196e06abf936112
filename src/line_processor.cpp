#include "line_processor.hpp"

#include "evaluator.hpp"
#include "shunting_yard.hpp"
#include "tokenizer.hpp"

#include <cctype>

namespace linecalc {

std::string LineOutcome::postfixText() const {
    return joinTokens(postfix);
}

std::string LineOutcome::resultText() const {
    if (value.has_value()) {
        return std::to_string(*value);
    }
    if (error.has_value()) {
        return "Error: " + error->message;
    }
    return "";
}

bool isValidVariableName(const std::string& name) {
    if (name.empty() || !std::isalpha(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    for (char ch : name) {
        if (!std::isalnum(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

LineProcessor::LineProcessor(SessionState& state) : state(state) {}

std::optional<LineOutcome> LineProcessor::process(std::size_t lineNumber, const std::string& line) {
    LineOutcome outcome;
    outcome.lineNumber = lineNumber;
    outcome.text = trim(line);
    if (outcome.text.empty()) {
        return std::nullopt;
    }

    const std::string& code = outcome.text;
    std::size_t eq = code.find('=');

    // Выражение без присваивания
    if (eq == std::string::npos) {
        if (auto error = evaluateExpression(code, outcome)) {
            return fail(std::move(outcome), std::move(*error));
        }
        return outcome;
    }

    // Присваивание: ровно один '=' и корректное имя слева
    if (code.find('=', eq + 1) != std::string::npos) {
        return fail(std::move(outcome), EvalError::malformedAssignment());
    }

    std::string name = trim(code.substr(0, eq));
    if (!isValidVariableName(name)) {
        return fail(std::move(outcome), EvalError::invalidVariableName(name));
    }

    if (auto error = evaluateExpression(code.substr(eq + 1), outcome)) {
        return fail(std::move(outcome), std::move(*error));
    }

    state.variables[name] = *outcome.value;
    state.usedVariables.insert(name);
    outcome.target = std::move(name);
    return outcome;
}

std::optional<EvalError> LineProcessor::evaluateExpression(const std::string& expression,
                                                           LineOutcome& outcome) const {
    Tokenizer tokenizer(expression);
    auto tokens = tokenizer.tokenize();

    // Неопределенные переменные ищем до преобразования и вычисления
    for (const auto& token : tokens) {
        if (token.type == TokenType::Identifier && !state.variables.contains(token.text)) {
            return EvalError::undefinedVariable(token.text);
        }
    }

    ShuntingYardConverter converter(std::move(tokens));
    outcome.postfix = converter.convert();

    PostfixEvaluator evaluator(state.variables);
    auto result = evaluator.evaluate(outcome.postfix);
    if (!result) {
        return result.error();
    }
    outcome.value = result.value();
    return std::nullopt;
}

LineOutcome LineProcessor::fail(LineOutcome outcome, EvalError error) {
    state.errors.push_back("Line " + std::to_string(outcome.lineNumber) + ": " + error.message);
    outcome.value.reset();
    outcome.error = std::move(error);
    return outcome;
}

} // namespace linecalc
