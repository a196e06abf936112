#include "evaluator.hpp"

#include <charconv>
#include <limits>

namespace linecalc {

namespace {
constexpr Value kMax = std::numeric_limits<Value>::max();
constexpr Value kMin = std::numeric_limits<Value>::min();

bool addOverflows(Value a, Value b) {
    return (b > 0 && a > kMax - b) || (b < 0 && a < kMin - b);
}

bool subOverflows(Value a, Value b) {
    return (b < 0 && a > kMax + b) || (b > 0 && a < kMin + b);
}

bool mulOverflows(Value a, Value b) {
    if (a == 0 || b == 0) {
        return false;
    }
    if (a > 0) {
        return b > 0 ? a > kMax / b : b < kMin / a;
    }
    return b > 0 ? a < kMin / b : b < kMax / a;
}
}

PostfixEvaluator::PostfixEvaluator(const VariableStore& variables) : variables(variables) {}

Result<Value> PostfixEvaluator::evaluate(const std::vector<Token>& postfix) const {
    std::vector<Value> stack;
    stack.reserve(postfix.size());

    for (const auto& token : postfix) {
        if (token.isOperand()) {
            auto operand = operandValue(token);
            if (!operand) {
                return operand.error();
            }
            stack.push_back(operand.value());
            continue;
        }

        // Операция (или оставшаяся в записи скобка): нужны два операнда
        if (stack.size() < 2) {
            return EvalError::invalidExpression();
        }
        Value b = stack.back();
        stack.pop_back();
        Value a = stack.back();
        stack.pop_back();

        auto result = applyOperator(a, b, token.text);
        if (!result) {
            return result.error();
        }
        stack.push_back(result.value());
    }

    // В конце на стеке должно остаться ровно одно значение
    if (stack.size() != 1) {
        return EvalError::invalidExpression();
    }
    return stack.back();
}

Result<Value> PostfixEvaluator::operandValue(const Token& token) const {
    if (token.type == TokenType::Number) {
        Value value = 0;
        const char* first = token.text.data();
        const char* last = first + token.text.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc::result_out_of_range) {
            return EvalError::overflow();
        }
        if (ec != std::errc() || ptr != last) {
            return EvalError::invalidExpression();
        }
        return value;
    }

    auto it = variables.find(token.text);
    if (it == variables.end()) {
        return EvalError::undefinedVariable(token.text);
    }
    return it->second;
}

Result<Value> applyOperator(Value a, Value b, const std::string& op) {
    if (op == "+") {
        if (addOverflows(a, b)) {
            return EvalError::overflow();
        }
        return a + b;
    }
    if (op == "-") {
        if (subOverflows(a, b)) {
            return EvalError::overflow();
        }
        return a - b;
    }
    if (op == "*") {
        if (mulOverflows(a, b)) {
            return EvalError::overflow();
        }
        return a * b;
    }
    if (op == "/") {
        if (b == 0) {
            return EvalError::divisionByZero();
        }
        if (a == kMin && b == -1) {
            return EvalError::overflow();
        }
        Value quotient = a / b;
        if (a % b != 0 && ((a < 0) != (b < 0))) {
            --quotient;
        }
        return quotient;
    }
    if (op == "%") {
        if (b == 0) {
            return EvalError::divisionByZero();
        }
        if (b == -1) {
            return Value{0};
        }
        Value remainder = a % b;
        if (remainder != 0 && ((remainder < 0) != (b < 0))) {
            remainder += b;
        }
        return remainder;
    }
    // Скобка, попавшая в постфикс из-за незакрытой '('
    return EvalError::invalidExpression();
}

} // namespace linecalc
