#include "user_input.hpp"
#include "console.hpp"
#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {
// Чтение строки ответа без пробелов по краям
std::string readAnswer() {
    std::string input;
    if (!std::getline(std::cin, input)) {
        throw std::runtime_error("Ввод прерван");
    }
    input.erase(0, input.find_first_not_of(" \t"));
    input.erase(input.find_last_not_of(" \t") + 1);
    return input;
}
}

std::size_t parseNumber(const std::string& value) {
    try {
        std::size_t result = std::stoul(value);
        if (result == 0) {
            throw std::runtime_error("Число должно быть положительным");
        }
        return result;
    }
    catch (const std::exception&) {
        throw std::runtime_error("Некорректное числовое значение");
    }
}

std::filesystem::path selectInputFile() {
    std::filesystem::path testsDir = findProjectRoot() / "tests";
    auto programFiles = findProgramFiles(testsDir);

    if (programFiles.empty()) {
        std::cout << Color::YELLOW << "Внимание: " << Color::RESET
            << "не найдено .txt/.in файлов в папке tests.\n";
        std::cout << "Директория: " << Color::CYAN << testsDir << Color::RESET << "\n\n";
    }
    else {
        std::cout << Color::BOLD << "Найденные программы в папке tests:\n" << Color::RESET;
        for (std::size_t i = 0; i < programFiles.size(); ++i) {
            std::cout << "  " << Color::CYAN << (i + 1) << Color::RESET << ". "
                << Color::YELLOW << programFiles[i].filename().string() << Color::RESET << "\n";
        }
        std::cout << "\n";
    }

    std::cout << Color::BOLD << "Введите номер файла или путь до входного файла: " << Color::RESET;
    std::string input = readAnswer();
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }

    bool isNumber = std::all_of(input.begin(), input.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });

    if (isNumber && !programFiles.empty()) {
        std::size_t index = parseNumber(input);
        if (index > programFiles.size()) {
            throw std::runtime_error("Номер файла вне допустимого диапазона");
        }
        return programFiles[index - 1];
    }

    std::filesystem::path inputPath = input;
    if (!std::filesystem::exists(inputPath)) {
        throw std::runtime_error("Файл не найден: " + inputPath.string());
    }
    return inputPath;
}

std::optional<std::filesystem::path> selectCsvOutput(const std::filesystem::path& inputPath) {
    std::cout << Color::BOLD << "Сохранить результаты строк в CSV?\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". Нет\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". Название по умолчанию (имя входного файла + _results_ + время)\n";
    std::cout << "  " << Color::CYAN << "3" << Color::RESET << ". Кастомное название\n\n";

    std::cout << Color::BOLD << "Ваш выбор (1, 2 или 3): " << Color::RESET;
    std::string choice = readAnswer();

    if (choice.empty() || choice == "1") {
        return std::nullopt;
    }
    if (choice == "2") {
        std::string name = inputPath.stem().string() + "_results_" + getCurrentTimeString() + ".csv";
        return inputPath.parent_path() / name;
    }
    if (choice == "3") {
        std::cout << Color::BOLD << "Введите название файла (расширение .csv добавится автоматически): " << Color::RESET;
        std::string customName = readAnswer();
        if (customName.empty()) {
            throw std::runtime_error("Пустое название файла");
        }

        // Относительный путь считаем от директории входного файла
        std::filesystem::path customPath(customName);
        std::filesystem::path outputPath = customPath.is_absolute() ? customPath : inputPath.parent_path() / customPath;
        if (outputPath.extension() != ".csv") {
            outputPath.replace_extension(".csv");
        }
        return outputPath;
    }
    throw std::runtime_error("Некорректный выбор. Используйте 1, 2 или 3");
}

bool askContinue() {
    std::cout << Color::BOLD << "Обработать еще один файл? (y/n): " << Color::RESET;
    std::string input;
    if (!std::getline(std::cin, input)) {
        return false;
    }

    input.erase(0, input.find_first_not_of(" \t"));
    input.erase(input.find_last_not_of(" \t") + 1);
    std::transform(input.begin(), input.end(), input.begin(), ::tolower);

    return (input == "y" || input == "yes" || input == "д" || input == "да");
}
