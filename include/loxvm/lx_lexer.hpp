// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_lexer.hpp
 * @brief On-demand scanner turning source text into tokens.
 *
 * Tokens reference the source buffer through string_views, so the
 * source must outlive every token produced from it.
 */

#pragma once

#include "lx_token.hpp"

#include <vector>

namespace loxvm {

class Lexer {
public:
    explicit Lexer(std::string_view source);

    // Returns Eof forever once the input is exhausted.
    Token next_token();
    std::vector<Token> tokenize_all();

private:
    std::string_view source_;
    size_t pos_{0};
    size_t token_start_{0};
    uint32_t line_{1};
    uint32_t column_{1};
    uint32_t token_line_{1};
    uint32_t token_column_{1};

    bool at_end() const { return pos_ >= source_.size(); }
    char char_at(size_t ahead) const;
    char bump();
    bool accept(char expected);
    void skip_trivia();

    Token emit(TokenType type) const;
    Token fail(const char* message) const;
    Token either(char second, TokenType if_matched, TokenType otherwise);

    Token lex_number();
    Token lex_string();
    Token lex_word();
};

} // namespace loxvm
