// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_token.cpp
 * @brief Token naming and keyword lookup.
 */

#include "loxvm/lx_token.hpp"

#include <array>
#include <unordered_map>

namespace loxvm {

bool Token::is_keyword() const {
    return type >= TokenType::And && type <= TokenType::While;
}

std::string Token::to_string() const {
    std::string result = TokenUtils::token_type_name(type);
    if (!lexeme.empty()) {
        result += " '" + std::string(lexeme) + "'";
    }
    result += " at line " + std::to_string(line) + ":" + std::to_string(column);
    return result;
}

const char* TokenUtils::token_type_name(TokenType type) {
    static constexpr std::array<const char*,
        static_cast<size_t>(TokenType::Semicolon) + 1> kTokenTypeNames = {
        "EOF",
        "ERROR",
        "NUMBER",
        "STRING",
        "IDENTIFIER",
        "AND",
        "CLASS",
        "ELSE",
        "FALSE",
        "FOR",
        "FUN",
        "IF",
        "NIL",
        "OR",
        "PRINT",
        "RETURN",
        "SUPER",
        "THIS",
        "TRUE",
        "TYPEOF",
        "VAR",
        "WHILE",
        "PLUS",
        "MINUS",
        "STAR",
        "SLASH",
        "BANG",
        "BANG_EQUAL",
        "EQUAL",
        "EQUAL_EQUAL",
        "GREATER",
        "GREATER_EQUAL",
        "LESS",
        "LESS_EQUAL",
        "LEFT_PAREN",
        "RIGHT_PAREN",
        "LEFT_BRACE",
        "RIGHT_BRACE",
        "COMMA",
        "DOT",
        "SEMICOLON",
    };

    const auto index = static_cast<size_t>(type);
    if (index < kTokenTypeNames.size()) {
        return kTokenTypeNames[index];
    }
    return "UNKNOWN";
}

TokenType TokenUtils::keyword_type(std::string_view str) {
    static const std::unordered_map<std::string_view, TokenType> keywords = {
        {"and", TokenType::And},
        {"class", TokenType::Class},
        {"else", TokenType::Else},
        {"false", TokenType::False},
        {"for", TokenType::For},
        {"fun", TokenType::Fun},
        {"if", TokenType::If},
        {"nil", TokenType::Nil},
        {"or", TokenType::Or},
        {"print", TokenType::Print},
        {"return", TokenType::Return},
        {"super", TokenType::Super},
        {"this", TokenType::This},
        {"true", TokenType::True},
        {"typeof", TokenType::Typeof},
        {"var", TokenType::Var},
        {"while", TokenType::While},
    };

    auto it = keywords.find(str);
    if (it != keywords.end()) {
        return it->second;
    }
    return TokenType::Identifier;
}

bool TokenUtils::is_keyword(std::string_view str) {
    return keyword_type(str) != TokenType::Identifier;
}

} // namespace loxvm
