#include "console.hpp"

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║    Построчный интерпретатор выражений linecalc v1.0       ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printError(const std::string& message, std::ostream& out) {
    out << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << message << Color::RESET << "\n";
}

void printUsage(const char* programName) {
    std::cout << "Использование:\n"
        << "  " << programName << "                 интерактивный режим\n"
        << "  " << programName << " <файл>          обработать программу из файла\n"
        << "  " << programName << " -               читать программу из stdin\n"
        << "\nПараметры:\n"
        << "  --csv <файл>   дополнительно сохранить результаты строк в CSV\n"
        << "  --help         эта справка\n";
}
