#include "cli.hpp"

#include "console.hpp"
#include "csv_writer.hpp"
#include "file_utils.hpp"
#include "report_writer.hpp"

#include <stdexcept>

namespace linecalc {

CliOptions parseArguments(const std::vector<std::string>& args) {
    CliOptions options;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        }
        else if (arg == "--csv") {
            if (i + 1 >= args.size()) {
                throw std::runtime_error("После --csv ожидается путь к файлу");
            }
            options.csvPath = args[++i];
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            throw std::runtime_error("Неизвестный параметр: " + arg);
        }
        else if (options.inputPath) {
            throw std::runtime_error("Можно указать только один входной файл");
        }
        else {
            options.inputPath = arg;
        }
    }

    if (options.csvPath && !options.inputPath && !options.showHelp) {
        throw std::runtime_error("Параметр --csv требует входной файл");
    }
    return options;
}

void requireProgramText(const std::string& text) {
    if (trim(text).empty()) {
        throw std::runtime_error("Входные данные пусты: нечего обрабатывать");
    }
}

void exportCsv(const std::filesystem::path& path, const SessionReport& report) {
    CsvWriter writer(path);
    writer.write(report.outcomes);
}

void printStatistics(std::ostream& out, const SessionReport& report, std::chrono::milliseconds duration) {
    std::size_t failed = 0;
    for (const auto& outcome : report.outcomes) {
        if (!outcome.succeeded()) {
            ++failed;
        }
    }

    out << "\n" << Color::BOLD << "Статистика:\n" << Color::RESET;
    out << "  Обработано строк: " << Color::CYAN << report.outcomes.size() << Color::RESET << "\n";
    out << "  Успешно:          " << Color::GREEN << report.outcomes.size() - failed << Color::RESET << "\n";
    if (failed > 0) {
        out << "  Ошибок:           " << Color::RED << failed << Color::RESET << "\n";
    }
    out << "  Переменных:       " << Color::CYAN << report.usedVariables.size() << Color::RESET << "\n";
    out << "  Время обработки:  " << Color::MAGENTA << duration.count()
        << " мс" << Color::RESET << "\n\n";
}

int runBatch(const CliOptions& options, std::istream& input, std::ostream& out, std::ostream& err) {
    try {
        if (!options.inputPath) {
            throw std::runtime_error("Не указан входной файл");
        }
        std::string source = (*options.inputPath == "-")
            ? readStream(input)
            : readTextFile(*options.inputPath);
        requireProgramText(source);

        auto start = std::chrono::high_resolution_clock::now();
        Session session;
        SessionReport report = session.run(source);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start);

        writeReport(out, report, source);
        printStatistics(err, report, duration);

        if (options.csvPath) {
            exportCsv(*options.csvPath, report);
        }
        return 0;
    }
    catch (const std::exception& ex) {
        printError(ex.what(), err);
        return 1;
    }
}

} // namespace linecalc
