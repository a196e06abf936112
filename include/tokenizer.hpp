#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace linecalc {

// Класс лексического анализатора (лексера)
// Преобразует текст выражения в последовательность токенов.
// Неизвестные символы (включая пробелы) молча пропускаются.
class Tokenizer {
public:
    explicit Tokenizer(std::string sourceText);

    // Основной метод запуска токенизации.
    // Пустой ввод дает пустой вектор, ошибок не бывает.
    std::vector<Token> tokenize();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    bool isAtEnd() const;
    char peek() const;
    char advance();

    // Считывает максимальную последовательность цифр
    Token makeNumber();

    // Считывает идентификатор: буква, затем буквы и цифры (x1 - один токен)
    Token makeIdentifier();
};

} // namespace linecalc
