// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_token.hpp
 * @brief Token types and the Token record produced by the Lexer.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace loxvm {

// Token types
enum class TokenType {
    // End of file
    Eof,
    Error,

    // Literals
    Number,
    String,
    Identifier,

    // Keywords
    And,
    Class,
    Else,
    False,
    For,
    Fun,
    If,
    Nil,
    Or,
    Print,
    Return,
    Super,
    This,
    True,
    Typeof,
    Var,
    While,

    // Operators
    Plus,           // +
    Minus,          // -
    Star,           // *
    Slash,          // /
    Bang,           // !
    BangEqual,      // !=
    Equal,          // =
    EqualEqual,     // ==
    Greater,        // >
    GreaterEqual,   // >=
    Less,           // <
    LessEqual,      // <=

    // Delimiters
    LeftParen,      // (
    RightParen,     // )
    LeftBrace,      // {
    RightBrace,     // }
    Comma,          // ,
    Dot,            // .
    Semicolon,      // ;
};

// Token structure. The lexeme views the source text, except for Error
// tokens where it holds the (static) error message.
struct Token {
    TokenType type;
    std::string_view lexeme;
    uint32_t line;
    uint32_t column;

    Token()
        : type(TokenType::Eof), line(0), column(0) {}

    Token(TokenType t, std::string_view lex, uint32_t ln, uint32_t col)
        : type(t), lexeme(lex), line(ln), column(col) {}

    bool is_keyword() const;
    std::string to_string() const;
};

// Token utilities
class TokenUtils {
public:
    static const char* token_type_name(TokenType type);

    // Check if string is a keyword; Identifier otherwise
    static TokenType keyword_type(std::string_view str);
    static bool is_keyword(std::string_view str);
};

} // namespace loxvm
