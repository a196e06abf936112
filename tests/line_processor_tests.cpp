#include "line_processor_tests.hpp"
#include "line_processor.hpp"

#include <cassert>
#include <string>

using namespace linecalc;

void test_line_assignment_then_reference() {
    SessionState state;
    LineProcessor processor(state);

    auto first = processor.process(1, "x = 5");
    assert(first.has_value());
    assert(first->succeeded());
    assert(first->target == "x");
    assert(first->value == 5);
    assert(first->postfixText() == "5");
    assert(first->resultText() == "5");

    auto second = processor.process(2, "x + 1");
    assert(second->succeeded());
    assert(!second->target.has_value());
    assert(second->value == 6);
    assert(second->postfixText() == "x 1 +");

    assert(state.variables.at("x") == 5);
    assert(state.usedVariables.count("x") == 1);
    assert(state.errors.empty());
}

void test_line_bare_expression_keeps_store() {
    SessionState state;
    LineProcessor processor(state);

    auto outcome = processor.process(1, "  2 + 3 * 4  ");
    assert(outcome->text == "2 + 3 * 4");
    assert(outcome->postfixText() == "2 3 4 * +");
    assert(outcome->value == 14);
    assert(state.variables.empty());
    assert(state.usedVariables.empty());
}

void test_line_invalid_variable_name() {
    SessionState state;
    LineProcessor processor(state);

    auto outcome = processor.process(3, "1x = 2");
    assert(!outcome->succeeded());
    assert(outcome->error->kind == ErrorKind::InvalidVariableName);
    assert(outcome->postfix.empty());
    assert(state.variables.empty());
    assert(state.errors.size() == 1);
    assert(state.errors[0] == "Line 3: Invalid variable name '1x'");

    auto empty = processor.process(4, "= 7");
    assert(empty->error->kind == ErrorKind::InvalidVariableName);
    assert(state.errors.size() == 2);
}

void test_line_malformed_assignment() {
    SessionState state;
    LineProcessor processor(state);

    auto outcome = processor.process(1, "a = b = 3");
    assert(outcome->error->kind == ErrorKind::MalformedAssignment);
    assert(outcome->postfix.empty());
    assert(state.variables.empty());
    assert(state.errors[0] == "Line 1: Malformed assignment: expected exactly one '='");
}

void test_line_undefined_variable_before_evaluation() {
    SessionState state;
    LineProcessor processor(state);

    auto outcome = processor.process(1, "z + 1");
    assert(outcome->error->kind == ErrorKind::UndefinedVariable);
    assert(outcome->error->message == "Undefined variable 'z'");
    assert(outcome->resultText() == "Error: Undefined variable 'z'");
    assert(outcome->postfix.empty());

    // Неопределенная переменная обнаруживается даже в выражении,
    // которое иначе упало бы на делении на ноль
    auto masked = processor.process(2, "1 / 0 + q");
    assert(masked->error->kind == ErrorKind::UndefinedVariable);
    assert(state.errors[1] == "Line 2: Undefined variable 'q'");
}

void test_line_division_by_zero_keeps_postfix() {
    SessionState state;
    LineProcessor processor(state);

    auto outcome = processor.process(1, "y = 4 / 0");
    assert(outcome->error->kind == ErrorKind::DivisionByZero);
    assert(outcome->resultText() == "Error: Division by zero");
    assert(outcome->postfixText() == "4 0 /");
    assert(!outcome->target.has_value());
    assert(!state.variables.contains("y"));
    assert(state.usedVariables.empty());

    auto modulo = processor.process(2, "5 % (2 - 2)");
    assert(modulo->error->kind == ErrorKind::DivisionByZero);
}

void test_line_blank_is_skipped() {
    SessionState state;
    LineProcessor processor(state);

    assert(!processor.process(1, "").has_value());
    assert(!processor.process(2, "   \t ").has_value());
    assert(state.errors.empty());
}

void test_line_variable_name_rules() {
    assert(isValidVariableName("x"));
    assert(isValidVariableName("x1"));
    assert(isValidVariableName("Total42b"));
    assert(!isValidVariableName(""));
    assert(!isValidVariableName("1x"));
    assert(!isValidVariableName("my_var"));
    assert(!isValidVariableName("a b"));

    SessionState state;
    LineProcessor processor(state);
    auto outcome = processor.process(1, "x1 = 2 * 3");
    assert(outcome->succeeded());
    assert(state.variables.at("x1") == 6);

    // Повторное присваивание заменяет значение
    processor.process(2, "x1 = x1 + 1");
    assert(state.variables.at("x1") == 7);
}
