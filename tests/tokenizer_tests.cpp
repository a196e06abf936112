#include "tokenizer_tests.hpp"
#include "tokenizer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace linecalc;

static void check_tokens(const std::string& source, const std::vector<Token>& expected) {
    Tokenizer tokenizer(source);
    auto tokens = tokenizer.tokenize();
    if (tokens != expected) {
        std::cerr << "Tokenize failed for '" << source << "': got " << tokens.size() << " tokens" << std::endl;
        assert(false);
    }
}

void test_tokenize_numbers_and_operators() {
    check_tokens("12+3*(45-6)/7%8", {
        {TokenType::Number, "12", 0},
        {TokenType::Operator, "+", 0},
        {TokenType::Number, "3", 0},
        {TokenType::Operator, "*", 0},
        {TokenType::LParen, "(", 0},
        {TokenType::Number, "45", 0},
        {TokenType::Operator, "-", 0},
        {TokenType::Number, "6", 0},
        {TokenType::RParen, ")", 0},
        {TokenType::Operator, "/", 0},
        {TokenType::Number, "7", 0},
        {TokenType::Operator, "%", 0},
        {TokenType::Number, "8", 0},
    });
}

void test_tokenize_identifiers_with_digits() {
    check_tokens("x1 + abc2def", {
        {TokenType::Identifier, "x1", 0},
        {TokenType::Operator, "+", 0},
        {TokenType::Identifier, "abc2def", 0},
    });
    // Число, за которым сразу идут буквы, дает два токена
    check_tokens("2x", {
        {TokenType::Number, "2", 0},
        {TokenType::Identifier, "x", 0},
    });
}

void test_tokenize_skips_unknown_characters() {
    check_tokens("  7 # $ 3.5 ", {
        {TokenType::Number, "7", 0},
        {TokenType::Number, "3", 0},
        {TokenType::Number, "5", 0},
    });
    check_tokens("\t a\t", {
        {TokenType::Identifier, "a", 0},
    });
}

void test_tokenize_empty_input() {
    check_tokens("", {});
    check_tokens("   ", {});
}

void test_tokenize_positions() {
    Tokenizer tokenizer("ab + 10");
    auto tokens = tokenizer.tokenize();
    assert(tokens.size() == 3);
    assert(tokens[0].position == 0);
    assert(tokens[1].position == 3);
    assert(tokens[2].position == 5);
}
