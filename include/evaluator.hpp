#pragma once

#include <vector>

#include "eval_error.hpp"
#include "token.hpp"

namespace linecalc {

// Стековый вычислитель постфиксной записи.
// Переменные читаются из хранилища, само хранилище не изменяется.
class PostfixEvaluator {
public:
    explicit PostfixEvaluator(const VariableStore& variables);

    // Вычисляет постфиксную последовательность.
    // Пример: "2 3 4 * +" -> 14
    // Ошибки (деление на ноль, нехватка операндов, переполнение)
    // возвращаются в Result, исключения не выбрасываются.
    Result<Value> evaluate(const std::vector<Token>& postfix) const;

private:
    const VariableStore& variables;

    Result<Value> operandValue(const Token& token) const;
};

// Применяет бинарную операцию к a и b ('/' и '%' - с округлением вниз)
Result<Value> applyOperator(Value a, Value b, const std::string& op);

} // namespace linecalc
