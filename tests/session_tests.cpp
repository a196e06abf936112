#include "session_tests.hpp"
#include "csv_writer.hpp"
#include "file_utils.hpp"
#include "report_writer.hpp"
#include "session.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace linecalc;

void test_session_round_trip() {
    Session session;
    auto report = session.run("x = 5\nx + 1\n");

    assert(report.outcomes.size() == 2);
    assert(report.outcomes[0].value == 5);
    assert(report.outcomes[1].value == 6);
    assert(report.usedVariables.size() == 1);
    assert(report.usedVariables.at("x") == 5);
    assert(!report.hasErrors());
}

void test_session_blank_lines_and_numbering() {
    Session session;
    auto report = session.run("\n  \na = 2\n\n\t\na * 3\n\n");

    assert(report.outcomes.size() == 2);
    assert(report.outcomes[0].lineNumber == 3);
    assert(report.outcomes[1].lineNumber == 6);
    assert(report.outcomes[1].value == 6);
    assert(report.errors.empty());
}

void test_session_errors_do_not_stop_processing() {
    Session session;
    auto report = session.run(
        "y = 4 / 0\n"
        "y + 1\n"
        "1x = 2\n"
        "b = 3\n"
        "b % 2\n");

    assert(report.outcomes.size() == 5);
    assert(report.errors.size() == 3);
    assert(report.errors[0] == "Line 1: Division by zero");
    assert(report.errors[1] == "Line 2: Undefined variable 'y'");
    assert(report.errors[2] == "Line 3: Invalid variable name '1x'");
    assert(report.outcomes[4].value == 1);

    // Неудачное присваивание не попадает в список переменных
    assert(report.usedVariables.size() == 1);
    assert(report.usedVariables.at("b") == 3);
}

void test_session_is_idempotent() {
    const std::string program = "a = 10\nb = a / 3\nc = a % b + q\nb * (a - 4)\n";
    Session session;
    std::string first = renderReport(session.run(program), program);
    std::string second = renderReport(session.run(program), program);
    assert(first == second);

    // Переменные одного запуска не видны в следующем
    auto report = session.run("a + 1");
    assert(report.outcomes[0].error->kind == ErrorKind::UndefinedVariable);
}

void test_session_split_lines() {
    auto lines = splitLines("a\r\nb\rc\n\nd");
    assert(lines.size() == 5);
    assert(lines[0] == "a");
    assert(lines[1] == "b");
    assert(lines[2] == "c");
    assert(lines[3].empty());
    assert(lines[4] == "d");

    assert(splitLines("").empty());
    assert(splitLines("x\n").size() == 1);
}

void test_session_report_rendering() {
    const std::string program = "x = 2 + 3 * 4\nx / 0";
    Session session;
    std::string text = renderReport(session.run(program), program);

    const std::string expected =
        "Input lines:\n"
        "x = 2 + 3 * 4\nx / 0\n"
        "\n"
        "Output:\n"
        "Line 1: x = 2 + 3 * 4\n"
        "Postfix: 2 3 4 * +\n"
        "Result: 14\n"
        "\n"
        "Line 2: x / 0\n"
        "Postfix: x 0 /\n"
        "Result: Error: Division by zero\n"
        "\n"
        "-------------------------------------------\n"
        "Variables used:\n"
        "x = 14\n"
        "-------------------------------------------\n"
        "Errors found:\n"
        "Line 2: Division by zero\n";
    assert(text == expected);
}

void test_session_report_rendering_empty_sections() {
    const std::string program = "1 + 1";
    Session session;
    std::string text = renderReport(session.run(program), program);
    assert(text.find("No variables were used\n") != std::string::npos);
    assert(text.find("No errors detected\n") != std::string::npos);
}

void test_session_csv_export() {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "linecalc_session_test.csv";

    Session session;
    auto report = session.run("v = 6 * 7\nv / 0\n");
    {
        CsvWriter writer(path);
        writer.write(report.outcomes);
    }

    std::string content = readTextFile(path);
    std::filesystem::remove(path);

    const std::string expected =
        "line,expression,variable,postfix,status,result,message\n"
        "1,\"v = 6 * 7\",v,\"6 7 *\",success,42,\"\"\n"
        "2,\"v / 0\",,\"v 0 /\",error,,\"Division by zero\"\n";
    assert(content == expected);
}

void test_session_read_missing_file() {
    bool thrown = false;
    try {
        readTextFile(std::filesystem::temp_directory_path() / "linecalc_no_such_file.txt");
    }
    catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}
