#pragma once

#include <iostream>
#include <string>

// ANSI цветовые коды для форматирования вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* MAGENTA = "\033[35m";
}

// Вывод приветственного заголовка программы
void printHeader();

// Вывод ошибки уровня оболочки (по умолчанию в std::cerr)
void printError(const std::string& message, std::ostream& out = std::cerr);

// Справка по аргументам командной строки
void printUsage(const char* programName);
