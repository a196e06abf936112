#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <variant>

namespace linecalc {

// Значение выражения: 64-битное целое со знаком
using Value = std::int64_t;

// Хранилище переменных: имя -> последнее присвоенное значение.
// Упорядоченный map, чтобы любой вывод был детерминированным.
using VariableStore = std::map<std::string, Value>;

// Виды ошибок строки. Ни одна из них не прерывает сессию.
enum class ErrorKind {
    InvalidVariableName,
    MalformedAssignment,
    UndefinedVariable,
    DivisionByZero,
    InvalidExpression,
    Overflow
};

// Машинное имя вида ошибки ("division-by-zero" и т.п.)
const char* errorKindName(ErrorKind kind);

struct EvalError {
    ErrorKind kind;
    std::string message; // Текст для пользователя, без номера строки

    static EvalError invalidVariableName(const std::string& name);
    static EvalError malformedAssignment();
    static EvalError undefinedVariable(const std::string& name);
    static EvalError divisionByZero();
    static EvalError invalidExpression();
    static EvalError overflow();
};

// Результат этапа: значение либо типизированная ошибка.
// Проверяется явно на каждом шаге обработчика строки.
template <typename T>
class Result {
public:
    Result(T value) : data(std::move(value)) {}
    Result(EvalError error) : data(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data); }
    const EvalError& error() const { return std::get<EvalError>(data); }

private:
    std::variant<T, EvalError> data;
};

} // namespace linecalc
