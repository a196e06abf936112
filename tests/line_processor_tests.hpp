#pragma once

void test_line_assignment_then_reference();
void test_line_bare_expression_keeps_store();
void test_line_invalid_variable_name();
void test_line_malformed_assignment();
void test_line_undefined_variable_before_evaluation();
void test_line_division_by_zero_keeps_postfix();
void test_line_blank_is_skipped();
void test_line_variable_name_rules();
