#include "eval_error.hpp"

namespace linecalc {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidVariableName:
        return "invalid-variable-name";
    case ErrorKind::MalformedAssignment:
        return "malformed-assignment";
    case ErrorKind::UndefinedVariable:
        return "undefined-variable";
    case ErrorKind::DivisionByZero:
        return "division-by-zero";
    case ErrorKind::InvalidExpression:
        return "invalid-expression";
    case ErrorKind::Overflow:
        return "overflow";
    }
    return "unknown";
}

EvalError EvalError::invalidVariableName(const std::string& name) {
    return {ErrorKind::InvalidVariableName, "Invalid variable name '" + name + "'"};
}

EvalError EvalError::malformedAssignment() {
    return {ErrorKind::MalformedAssignment, "Malformed assignment: expected exactly one '='"};
}

EvalError EvalError::undefinedVariable(const std::string& name) {
    return {ErrorKind::UndefinedVariable, "Undefined variable '" + name + "'"};
}

EvalError EvalError::divisionByZero() {
    return {ErrorKind::DivisionByZero, "Division by zero"};
}

EvalError EvalError::invalidExpression() {
    return {ErrorKind::InvalidExpression, "Invalid expression"};
}

EvalError EvalError::overflow() {
    return {ErrorKind::Overflow, "Integer overflow"};
}

} // namespace linecalc
