#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace linecalc {

// Приоритет операции: + - => 1, * / % => 2, всё остальное => 0
int precedence(const Token& token);

// Преобразователь инфиксной записи в постфиксную (обратную польскую)
// по алгоритму сортировочной станции Дейкстры.
// Арность операций и баланс скобок здесь не проверяются: некорректный
// ввод проявляется позже как ошибка вычислителя.
class ShuntingYardConverter {
public:
    explicit ShuntingYardConverter(std::vector<Token> tokens);

    // Возвращает постфиксную последовательность токенов
    std::vector<Token> convert();

private:
    const std::vector<Token> tokens; // Входные токены (инфикс)
    std::vector<Token> output;       // Выходная очередь
    std::vector<Token> operators;    // Стек операций

    // Закрывающая скобка: выталкиваем операции до открывающей
    void closeParenthesis();

    // Бинарная операция: выталкиваем операции с приоритетом >= текущего
    void pushOperator(const Token& op);
};

// Постфиксная запись через пробел, например "2 3 4 * +"
std::string joinTokens(const std::vector<Token>& tokens);

} // namespace linecalc
