#pragma once

#include <cstddef>
#include <string>

namespace linecalc {

// Тип лексемы. Определяется один раз на этапе токенизации.
enum class TokenType {
    Number,     // Целочисленный литерал (только цифры)
    Identifier, // Имя переменной: буква, затем буквы/цифры
    Operator,   // Один из + - * / %
    LParen,     // (
    RParen      // )
};

// Лексема входного выражения
struct Token {
    TokenType type;
    std::string text;      // Исходный текст лексемы
    std::size_t position;  // Позиция начала лексемы в строке выражения

    bool isOperand() const {
        return type == TokenType::Number || type == TokenType::Identifier;
    }

    bool operator==(const Token& other) const {
        return type == other.type && text == other.text;
    }
};

} // namespace linecalc
