#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "eval_error.hpp"
#include "token.hpp"

namespace linecalc {

// Результат обработки одной непустой строки. После создания не меняется.
struct LineOutcome {
    std::size_t lineNumber = 0;        // Номер строки (с 1)
    std::string text;                  // Строка без окружающих пробелов
    std::optional<std::string> target; // Переменная, которой успешно присвоено значение
    std::vector<Token> postfix;        // Постфиксная запись (может быть пустой)
    std::optional<Value> value;        // Значение при успехе
    std::optional<EvalError> error;    // Ошибка при неудаче

    bool succeeded() const { return value.has_value(); }

    // Постфикс через пробел
    std::string postfixText() const;

    // "<значение>" или "Error: <сообщение>"
    std::string resultText() const;
};

// Общее состояние сессии, которое обработчик строк меняет по ходу работы
struct SessionState {
    VariableStore variables;             // Переменные и их значения
    std::set<std::string> usedVariables; // Имена, которым что-либо присваивалось
    std::vector<std::string> errors;     // "Line N: <сообщение>" в порядке появления
};

// Проверка имени переменной: ^[A-Za-z][A-Za-z0-9]*$
bool isValidVariableName(const std::string& name);

// Удаление пробельных символов по краям строки
std::string trim(const std::string& text);

// Обработчик одной строки программы.
// Распознает присваивание или выражение, проверяет имя переменной,
// заранее ищет неопределенные переменные, вычисляет выражение и
// обновляет состояние сессии. Ошибки не выходят за пределы process().
class LineProcessor {
public:
    explicit LineProcessor(SessionState& state);

    // Возвращает std::nullopt для пустой строки (она пропускается целиком)
    std::optional<LineOutcome> process(std::size_t lineNumber, const std::string& line);

private:
    SessionState& state;

    // Этап вычисления выражения; постфикс сохраняется в outcome даже при ошибке
    std::optional<EvalError> evaluateExpression(const std::string& expression, LineOutcome& outcome) const;

    // Оформление ошибки: запись в журнал сессии и в результат строки
    LineOutcome fail(LineOutcome outcome, EvalError error);
};

} // namespace linecalc
