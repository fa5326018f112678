// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_lexer.cpp
 * @brief Scanner for Lox source.
 */

#include "loxvm/lx_lexer.hpp"

#include <optional>

namespace loxvm {

namespace {

bool is_decimal(char c) {
    return c >= '0' && c <= '9';
}

bool starts_word(char c) {
    return c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool continues_word(char c) {
    return starts_word(c) || is_decimal(c);
}

std::optional<TokenType> single_char_token(char c) {
    switch (c) {
        case '(': return TokenType::LeftParen;
        case ')': return TokenType::RightParen;
        case '{': return TokenType::LeftBrace;
        case '}': return TokenType::RightBrace;
        case ',': return TokenType::Comma;
        case '.': return TokenType::Dot;
        case ';': return TokenType::Semicolon;
        case '-': return TokenType::Minus;
        case '+': return TokenType::Plus;
        case '/': return TokenType::Slash;
        case '*': return TokenType::Star;
        default:  return std::nullopt;
    }
}

} // namespace

Lexer::Lexer(std::string_view source)
    : source_(source) {}

char Lexer::char_at(size_t ahead) const {
    size_t index = pos_ + ahead;
    return index < source_.size() ? source_[index] : '\0';
}

char Lexer::bump() {
    char c = source_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

bool Lexer::accept(char expected) {
    if (at_end() || source_[pos_] != expected) {
        return false;
    }
    bump();
    return true;
}

// Whitespace and `//` comments.
void Lexer::skip_trivia() {
    while (!at_end()) {
        char c = char_at(0);
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            bump();
        } else if (c == '/' && char_at(1) == '/') {
            while (!at_end() && char_at(0) != '\n') {
                bump();
            }
        } else {
            return;
        }
    }
}

Token Lexer::emit(TokenType type) const {
    return Token(type, source_.substr(token_start_, pos_ - token_start_), token_line_, token_column_);
}

Token Lexer::fail(const char* message) const {
    return Token(TokenType::Error, std::string_view(message), token_line_, token_column_);
}

Token Lexer::either(char second, TokenType if_matched, TokenType otherwise) {
    return emit(accept(second) ? if_matched : otherwise);
}

Token Lexer::lex_number() {
    while (is_decimal(char_at(0))) {
        bump();
    }
    // A fraction needs at least one digit after the dot.
    if (char_at(0) == '.' && is_decimal(char_at(1))) {
        bump();
        while (is_decimal(char_at(0))) {
            bump();
        }
    }
    return emit(TokenType::Number);
}

Token Lexer::lex_string() {
    while (!at_end() && char_at(0) != '"') {
        bump();
    }
    if (at_end()) {
        return fail("Unterminated string.");
    }
    bump();
    return emit(TokenType::String);
}

Token Lexer::lex_word() {
    while (continues_word(char_at(0))) {
        bump();
    }
    return emit(TokenUtils::keyword_type(source_.substr(token_start_, pos_ - token_start_)));
}

Token Lexer::next_token() {
    skip_trivia();

    token_start_ = pos_;
    token_line_ = line_;
    token_column_ = column_;

    if (at_end()) {
        return emit(TokenType::Eof);
    }

    const char c = bump();
    if (starts_word(c)) return lex_word();
    if (is_decimal(c)) return lex_number();
    if (auto single = single_char_token(c)) return emit(*single);

    switch (c) {
        case '!': return either('=', TokenType::BangEqual, TokenType::Bang);
        case '=': return either('=', TokenType::EqualEqual, TokenType::Equal);
        case '<': return either('=', TokenType::LessEqual, TokenType::Less);
        case '>': return either('=', TokenType::GreaterEqual, TokenType::Greater);
        case '"': return lex_string();
        default:  return fail("Unexpected character.");
    }
}

std::vector<Token> Lexer::tokenize_all() {
    std::vector<Token> out;
    Token tok = next_token();
    while (tok.type != TokenType::Eof) {
        out.push_back(tok);
        tok = next_token();
    }
    out.push_back(tok);
    return out;
}

} // namespace loxvm
