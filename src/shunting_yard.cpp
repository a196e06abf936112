#include "shunting_yard.hpp"

namespace linecalc {

int precedence(const Token& token) {
    if (token.type != TokenType::Operator) {
        return 0;
    }
    if (token.text == "+" || token.text == "-") {
        return 1;
    }
    if (token.text == "*" || token.text == "/" || token.text == "%") {
        return 2;
    }
    return 0;
}

ShuntingYardConverter::ShuntingYardConverter(std::vector<Token> tokens) : tokens(std::move(tokens)) {}

std::vector<Token> ShuntingYardConverter::convert() {
    output.clear();
    operators.clear();
    output.reserve(tokens.size());

    for (const auto& token : tokens) {
        switch (token.type) {
        case TokenType::Number:
        case TokenType::Identifier:
            output.push_back(token);
            break;
        case TokenType::LParen:
            operators.push_back(token);
            break;
        case TokenType::RParen:
            closeParenthesis();
            break;
        case TokenType::Operator:
            pushOperator(token);
            break;
        }
    }

    // Остаток стека (включая незакрытые скобки) уходит в выход
    while (!operators.empty()) {
        output.push_back(operators.back());
        operators.pop_back();
    }
    return output;
}

// Лишняя ')' без пары ничего не ломает: стек просто опустошается
void ShuntingYardConverter::closeParenthesis() {
    while (!operators.empty() && operators.back().type != TokenType::LParen) {
        output.push_back(operators.back());
        operators.pop_back();
    }
    if (!operators.empty()) {
        operators.pop_back(); // Сбрасываем найденную '('
    }
}

// Равный приоритет выталкивается до вставки: левая ассоциативность
void ShuntingYardConverter::pushOperator(const Token& op) {
    const int current = precedence(op);
    while (!operators.empty() && operators.back().type == TokenType::Operator &&
           precedence(operators.back()) >= current) {
        output.push_back(operators.back());
        operators.pop_back();
    }
    operators.push_back(op);
}

std::string joinTokens(const std::vector<Token>& tokens) {
    std::string result;
    for (const auto& token : tokens) {
        if (!result.empty()) {
            result.push_back(' ');
        }
        result.append(token.text);
    }
    return result;
}

} // namespace linecalc
