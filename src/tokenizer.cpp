#include "tokenizer.hpp"

#include <cctype>

namespace linecalc {

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл разбора: проходит по строке и выделяет токены
std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (!isAtEnd()) {
        char ch = peek();
        switch (ch) {
        // Односимвольные токены
        case '+':
        case '-':
        case '*':
        case '/':
        case '%':
            tokens.push_back({TokenType::Operator, std::string(1, ch), index});
            advance();
            break;
        case '(':
            tokens.push_back({TokenType::LParen, "(", index});
            advance();
            break;
        case ')':
            tokens.push_back({TokenType::RParen, ")", index});
            advance();
            break;
        default:
            if (std::isdigit(static_cast<unsigned char>(ch))) {
                tokens.push_back(makeNumber());
            } else if (std::isalpha(static_cast<unsigned char>(ch))) {
                tokens.push_back(makeIdentifier());
            } else {
                // Пробелы и любые посторонние символы игнорируются
                advance();
            }
            break;
        }
    }
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::advance() {
    return source[index++];
}

// Разбор целочисленного литерала. Значение вычисляется позже, в вычислителе,
// чтобы переполнение стало ошибкой строки, а не лексера.
Token Tokenizer::makeNumber() {
    std::size_t start = index;
    while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
        advance();
    }
    return {TokenType::Number, source.substr(start, index - start), start};
}

Token Tokenizer::makeIdentifier() {
    std::size_t start = index;
    while (!isAtEnd() && std::isalnum(static_cast<unsigned char>(peek()))) {
        advance();
    }
    return {TokenType::Identifier, source.substr(start, index - start), start};
}

} // namespace linecalc
