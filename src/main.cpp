#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli.hpp"
#include "console.hpp"
#include "file_utils.hpp"
#include "report_writer.hpp"
#include "session.hpp"
#include "user_input.hpp"

namespace {

    void processFileInteractive() {
        std::filesystem::path inputPath = selectInputFile();
        std::optional<std::filesystem::path> csvPath = selectCsvOutput(inputPath);

        std::cout << "\n" << Color::BOLD << "Конфигурация:\n" << Color::RESET;
        std::cout << "  Входной файл:  " << Color::YELLOW << inputPath << Color::RESET << "\n";
        if (csvPath) {
            std::cout << "  Файл CSV:      " << Color::YELLOW << *csvPath << Color::RESET << "\n";
        }
        std::cout << "\n";

        std::string source = readTextFile(inputPath);
        linecalc::requireProgramText(source);

        auto start = std::chrono::high_resolution_clock::now();
        linecalc::Session session;
        linecalc::SessionReport report = session.run(source);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start);

        linecalc::writeReport(std::cout, report, source);
        linecalc::printStatistics(std::cout, report, duration);

        if (csvPath) {
            linecalc::exportCsv(*csvPath, report);
            std::cout << Color::GREEN << "Результаты сохранены в: " << *csvPath << Color::RESET << "\n\n";
        }
    }

    // Интерактивный режим: выбор файла из папки tests, повтор по запросу
    int runInteractive() {
        printHeader();

        bool continueProcessing = true;
        while (continueProcessing) {
            try {
                processFileInteractive();
            }
            catch (const std::exception& ex) {
                std::cerr << "\n";
                printError(ex.what());
                std::cerr << "\n";
            }

            continueProcessing = askContinue();
            if (continueProcessing) {
                std::cout << "\n";
            }
        }

        std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
        return 0;
    }

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    try {
        linecalc::CliOptions options = linecalc::parseArguments(std::vector<std::string>(argv + 1, argv + argc));
        if (options.showHelp) {
            printUsage(argv[0]);
            return 0;
        }
        if (options.inputPath) {
            return linecalc::runBatch(options, std::cin, std::cout, std::cerr);
        }
        return runInteractive();
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        return 1;
    }
}
