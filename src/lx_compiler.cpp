// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_compiler.cpp
 * @brief Pratt parser, scope resolution and bytecode emission.
 */

#include "loxvm/lx_compiler.hpp"

#include <array>
#include <charconv>
#include <limits>

namespace loxvm {

namespace {

constexpr size_t kTokenTypeCount = static_cast<size_t>(TokenType::Semicolon) + 1;

} // namespace

std::string CompileError::to_string() const {
    return "[line " + std::to_string(line) + "] Error" + location + ": " + message;
}

Compiler::Compiler(CompileOptions options)
    : options_(options) {}

std::optional<FunctionPrototype> Compiler::compile(std::string_view source) {
    lexer_ = Lexer(source);
    errors_.clear();
    panic_mode_ = false;
    recursion_depth_ = 0;

    FunctionScope script;
    script.kind = FunctionKind::Script;
    ScopeGuard guard(*this, script);
    // Slot 0 holds the callee.
    script.locals.push_back(Local{"", 0, false});

    try {
        advance();
        while (!match(TokenType::Eof)) {
            declaration();
        }
    } catch (const CompilerError& e) {
        errors_.push_back(CompileError{e.line(), "", e.message()});
    }

    FunctionPrototype proto = end_function();
    if (had_error()) {
        return std::nullopt;
    }
    return proto;
}

// ---- Parse rules ----

const Compiler::ParseRule& Compiler::get_rule(TokenType type) {
    static const auto rules = [] {
        std::array<ParseRule, kTokenTypeCount> table{};
        for (auto& rule : table) {
            rule = ParseRule{nullptr, nullptr, Precedence::None};
        }
        auto set = [&table](TokenType t, ParseFn prefix, ParseFn infix, Precedence precedence) {
            table[static_cast<size_t>(t)] = ParseRule{prefix, infix, precedence};
        };

        set(TokenType::LeftParen,    &Compiler::grouping,    &Compiler::call,    Precedence::Call);
        set(TokenType::Dot,          nullptr,                &Compiler::unsupported, Precedence::Call);
        set(TokenType::Minus,        &Compiler::unary,       &Compiler::binary,  Precedence::Term);
        set(TokenType::Plus,         nullptr,                &Compiler::binary,  Precedence::Term);
        set(TokenType::Slash,        nullptr,                &Compiler::binary,  Precedence::Factor);
        set(TokenType::Star,         nullptr,                &Compiler::binary,  Precedence::Factor);
        set(TokenType::Bang,         &Compiler::unary,       nullptr,            Precedence::None);
        set(TokenType::Typeof,       &Compiler::unary,       nullptr,            Precedence::None);
        set(TokenType::BangEqual,    nullptr,                &Compiler::binary,  Precedence::Equality);
        set(TokenType::EqualEqual,   nullptr,                &Compiler::binary,  Precedence::Equality);
        set(TokenType::Greater,      nullptr,                &Compiler::binary,  Precedence::Comparison);
        set(TokenType::GreaterEqual, nullptr,                &Compiler::binary,  Precedence::Comparison);
        set(TokenType::Less,         nullptr,                &Compiler::binary,  Precedence::Comparison);
        set(TokenType::LessEqual,    nullptr,                &Compiler::binary,  Precedence::Comparison);
        set(TokenType::Identifier,   &Compiler::variable,    nullptr,            Precedence::None);
        set(TokenType::String,       &Compiler::string,      nullptr,            Precedence::None);
        set(TokenType::Number,       &Compiler::number,      nullptr,            Precedence::None);
        set(TokenType::And,          nullptr,                &Compiler::and_,    Precedence::And);
        set(TokenType::Or,           nullptr,                &Compiler::or_,     Precedence::Or);
        set(TokenType::False,        &Compiler::literal,     nullptr,            Precedence::None);
        set(TokenType::True,         &Compiler::literal,     nullptr,            Precedence::None);
        set(TokenType::Nil,          &Compiler::literal,     nullptr,            Precedence::None);
        set(TokenType::This,         &Compiler::unsupported, nullptr,            Precedence::None);
        set(TokenType::Super,        &Compiler::unsupported, nullptr,            Precedence::None);
        return table;
    }();
    return rules[static_cast<size_t>(type)];
}

// ---- Token stream ----

void Compiler::advance() {
    previous_ = current_;
    for (;;) {
        current_ = lexer_.next_token();
        if (current_.type != TokenType::Error) break;
        error_at_current(std::string(current_.lexeme));
    }
}

void Compiler::consume(TokenType type, const char* message) {
    if (current_.type == type) {
        advance();
        return;
    }
    error_at_current(message);
}

bool Compiler::check(TokenType type) const {
    return current_.type == type;
}

bool Compiler::match(TokenType type) {
    if (!check(type)) return false;
    advance();
    return true;
}

// ---- Error reporting ----

void Compiler::error_at(const Token& token, const std::string& message) {
    // Suppress cascades until the next statement boundary.
    if (panic_mode_) return;
    panic_mode_ = true;

    CompileError err;
    err.line = token.line;
    err.message = message;
    if (token.type == TokenType::Eof) {
        err.location = " at end";
    } else if (token.type != TokenType::Error) {
        err.location = " at '" + std::string(token.lexeme) + "'";
    }
    errors_.push_back(std::move(err));
}

void Compiler::error(const std::string& message) {
    error_at(previous_, message);
}

void Compiler::error_at_current(const std::string& message) {
    error_at(current_, message);
}

void Compiler::synchronize() {
    panic_mode_ = false;

    while (current_.type != TokenType::Eof) {
        if (previous_.type == TokenType::Semicolon) return;
        switch (current_.type) {
            case TokenType::Class:
            case TokenType::Fun:
            case TokenType::Var:
            case TokenType::For:
            case TokenType::If:
            case TokenType::While:
            case TokenType::Print:
            case TokenType::Return:
                return;
            default:
                break;
        }
        advance();
    }
}

// ---- Declarations ----

void Compiler::declaration() {
    RecursionGuard guard(*this);

    if (match(TokenType::Class)) {
        class_declaration();
    } else if (match(TokenType::Fun)) {
        fun_declaration();
    } else if (match(TokenType::Var)) {
        var_declaration();
    } else {
        statement();
    }

    if (panic_mode_) synchronize();
}

void Compiler::fun_declaration() {
    uint16_t global = parse_variable("Expect function name.");
    // A function may refer to itself before its body is complete.
    mark_initialized();
    function(FunctionKind::Function);
    define_variable(global);
}

void Compiler::var_declaration() {
    uint16_t global = parse_variable("Expect variable name.");

    if (match(TokenType::Equal)) {
        expression();
    } else {
        emit_op(OpCode::OP_NIL);
    }
    consume(TokenType::Semicolon, "Expect ';' after variable declaration.");

    define_variable(global);
}

void Compiler::class_declaration() {
    error("Classes are not supported.");

    // Skip the whole declaration so its body does not produce more errors.
    match(TokenType::Identifier);
    if (match(TokenType::Less)) {
        match(TokenType::Identifier);
    }
    if (match(TokenType::LeftBrace)) {
        int depth = 1;
        while (depth > 0 && !check(TokenType::Eof)) {
            if (check(TokenType::LeftBrace)) depth++;
            if (check(TokenType::RightBrace)) depth--;
            advance();
        }
    }
    panic_mode_ = false;
}

void Compiler::function(FunctionKind kind) {
    FunctionScope fn;
    fn.kind = kind;
    fn.name = std::string(previous_.lexeme);

    FunctionPrototype proto;
    {
        ScopeGuard guard(*this, fn);
        fn.locals.push_back(Local{"", 0, false});
        begin_scope();

        consume(TokenType::LeftParen, "Expect '(' after function name.");
        if (!check(TokenType::RightParen)) {
            do {
                fn.arity++;
                if (fn.arity > MAX_ARGUMENTS) {
                    error_at_current("Can't have more than 255 parameters.");
                }
                uint16_t constant = parse_variable("Expect parameter name.");
                define_variable(constant);
            } while (match(TokenType::Comma));
        }
        consume(TokenType::RightParen, "Expect ')' after parameters.");
        consume(TokenType::LeftBrace, "Expect '{' before function body.");
        block();

        proto = end_function();
    }

    uint16_t index = checked_index(current_chunk().add_function(std::move(proto)));
    emit_op_short(OpCode::OP_CLOSURE, index);
}

// ---- Statements ----

void Compiler::statement() {
    if (match(TokenType::Print)) {
        print_statement();
    } else if (match(TokenType::If)) {
        if_statement();
    } else if (match(TokenType::Return)) {
        return_statement();
    } else if (match(TokenType::While)) {
        while_statement();
    } else if (match(TokenType::For)) {
        for_statement();
    } else if (match(TokenType::LeftBrace)) {
        begin_scope();
        block();
        end_scope();
    } else {
        expression_statement();
    }
}

void Compiler::print_statement() {
    expression();
    consume(TokenType::Semicolon, "Expect ';' after value.");
    emit_op(OpCode::OP_PRINT);
}

void Compiler::if_statement() {
    consume(TokenType::LeftParen, "Expect '(' after 'if'.");
    expression();
    consume(TokenType::RightParen, "Expect ')' after condition.");

    size_t then_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE);
    emit_op(OpCode::OP_POP);
    statement();

    size_t else_jump = emit_jump(OpCode::OP_JUMP);
    patch_jump(then_jump);
    emit_op(OpCode::OP_POP);

    if (match(TokenType::Else)) statement();
    patch_jump(else_jump);
}

void Compiler::while_statement() {
    size_t loop_start = current_chunk().code_size();
    consume(TokenType::LeftParen, "Expect '(' after 'while'.");
    expression();
    consume(TokenType::RightParen, "Expect ')' after condition.");

    size_t exit_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE);
    emit_op(OpCode::OP_POP);
    statement();
    emit_loop(loop_start);

    patch_jump(exit_jump);
    emit_op(OpCode::OP_POP);
}

void Compiler::for_statement() {
    begin_scope();
    consume(TokenType::LeftParen, "Expect '(' after 'for'.");
    if (match(TokenType::Semicolon)) {
        // No initializer.
    } else if (match(TokenType::Var)) {
        var_declaration();
    } else {
        expression_statement();
    }

    size_t loop_start = current_chunk().code_size();
    std::optional<size_t> exit_jump;
    if (!match(TokenType::Semicolon)) {
        expression();
        consume(TokenType::Semicolon, "Expect ';' after loop condition.");

        exit_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE);
        emit_op(OpCode::OP_POP);
    }

    if (!match(TokenType::RightParen)) {
        size_t body_jump = emit_jump(OpCode::OP_JUMP);
        size_t increment_start = current_chunk().code_size();
        expression();
        emit_op(OpCode::OP_POP);
        consume(TokenType::RightParen, "Expect ')' after for clauses.");

        emit_loop(loop_start);
        loop_start = increment_start;
        patch_jump(body_jump);
    }

    statement();
    emit_loop(loop_start);

    if (exit_jump) {
        patch_jump(*exit_jump);
        emit_op(OpCode::OP_POP);
    }

    end_scope();
}

void Compiler::return_statement() {
    if (scope_->kind == FunctionKind::Script) {
        error("Can't return from top-level code.");
    }

    if (match(TokenType::Semicolon)) {
        emit_return();
    } else {
        expression();
        consume(TokenType::Semicolon, "Expect ';' after return value.");
        emit_op(OpCode::OP_RETURN);
    }
}

void Compiler::expression_statement() {
    expression();

    if (options_.repl_mode &&
        scope_->kind == FunctionKind::Script &&
        scope_->scope_depth == 0 &&
        check(TokenType::Eof)) {
        emit_op(OpCode::OP_PRINT);
        return;
    }

    consume(TokenType::Semicolon, "Expect ';' after expression.");
    emit_op(OpCode::OP_POP);
}

void Compiler::block() {
    while (!check(TokenType::RightBrace) && !check(TokenType::Eof)) {
        declaration();
    }
    consume(TokenType::RightBrace, "Expect '}' after block.");
}

// ---- Expressions ----

void Compiler::expression() {
    parse_precedence(Precedence::Assignment);
}

void Compiler::parse_precedence(Precedence precedence) {
    RecursionGuard guard(*this);

    advance();
    ParseFn prefix = get_rule(previous_.type).prefix;
    if (prefix == nullptr) {
        error("Expect expression.");
        return;
    }

    bool can_assign = precedence <= Precedence::Assignment;
    (this->*prefix)(can_assign);

    while (precedence <= get_rule(current_.type).precedence) {
        advance();
        ParseFn infix = get_rule(previous_.type).infix;
        (this->*infix)(can_assign);
    }

    if (can_assign && match(TokenType::Equal)) {
        error("Invalid assignment target.");
    }
}

void Compiler::number(bool) {
    Number value = 0;
    const char* first = previous_.lexeme.data();
    const char* last = first + previous_.lexeme.size();
    auto result = std::from_chars(first, last, value);
    if (result.ec != std::errc{}) {
        error("Invalid number literal.");
        return;
    }
    emit_constant(value);
}

void Compiler::string(bool) {
    // Strip the quotes.
    emit_string(previous_.lexeme.substr(1, previous_.lexeme.size() - 2));
}

void Compiler::literal(bool) {
    switch (previous_.type) {
        case TokenType::False: emit_op(OpCode::OP_FALSE); break;
        case TokenType::True:  emit_op(OpCode::OP_TRUE); break;
        case TokenType::Nil:   emit_op(OpCode::OP_NIL); break;
        default:
            throw InternalError("literal() called for a non-literal token");
    }
}

void Compiler::grouping(bool) {
    expression();
    consume(TokenType::RightParen, "Expect ')' after expression.");
}

void Compiler::unary(bool) {
    TokenType op = previous_.type;
    uint32_t line = previous_.line;

    parse_precedence(Precedence::Unary);

    switch (op) {
        case TokenType::Bang:   emit_op(OpCode::OP_NOT, line); break;
        case TokenType::Minus:  emit_op(OpCode::OP_NEGATE, line); break;
        case TokenType::Typeof: emit_op(OpCode::OP_TYPEOF, line); break;
        default:
            throw InternalError("unary() called for a non-unary token");
    }
}

void Compiler::binary(bool) {
    TokenType op = previous_.type;
    uint32_t line = previous_.line;
    const ParseRule& rule = get_rule(op);
    parse_precedence(static_cast<Precedence>(static_cast<int>(rule.precedence) + 1));

    switch (op) {
        case TokenType::Plus:         emit_op(OpCode::OP_ADD, line); break;
        case TokenType::Minus:        emit_op(OpCode::OP_SUBTRACT, line); break;
        case TokenType::Star:         emit_op(OpCode::OP_MULTIPLY, line); break;
        case TokenType::Slash:        emit_op(OpCode::OP_DIVIDE, line); break;
        case TokenType::EqualEqual:   emit_op(OpCode::OP_EQUAL, line); break;
        case TokenType::BangEqual:    emit_op(OpCode::OP_NOT_EQUAL, line); break;
        case TokenType::Less:         emit_op(OpCode::OP_LESS, line); break;
        case TokenType::Greater:      emit_op(OpCode::OP_GREATER, line); break;
        case TokenType::LessEqual:    emit_op(OpCode::OP_LESS_EQUAL, line); break;
        case TokenType::GreaterEqual: emit_op(OpCode::OP_GREATER_EQUAL, line); break;
        default:
            throw InternalError("binary() called for a non-binary token");
    }
}

void Compiler::and_(bool) {
    size_t end_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE);
    emit_op(OpCode::OP_POP);
    parse_precedence(Precedence::And);
    patch_jump(end_jump);
}

void Compiler::or_(bool) {
    size_t else_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE);
    size_t end_jump = emit_jump(OpCode::OP_JUMP);

    patch_jump(else_jump);
    emit_op(OpCode::OP_POP);

    parse_precedence(Precedence::Or);
    patch_jump(end_jump);
}

void Compiler::call(bool) {
    uint32_t line = previous_.line;
    uint8_t arg_count = argument_list();
    emit_op(OpCode::OP_CALL, line);
    emit_byte(arg_count);
}

uint8_t Compiler::argument_list() {
    int arg_count = 0;
    if (!check(TokenType::RightParen)) {
        do {
            expression();
            if (arg_count == MAX_ARGUMENTS) {
                error("Can't have more than 255 arguments.");
            }
            arg_count++;
        } while (match(TokenType::Comma));
    }
    consume(TokenType::RightParen, "Expect ')' after arguments.");
    return static_cast<uint8_t>(arg_count > MAX_ARGUMENTS ? MAX_ARGUMENTS : arg_count);
}

void Compiler::variable(bool can_assign) {
    named_variable(previous_, can_assign);
}

void Compiler::unsupported(bool) {
    switch (previous_.type) {
        case TokenType::This:
            error("Can't use 'this': classes are not supported.");
            break;
        case TokenType::Super:
            error("Can't use 'super': classes are not supported.");
            break;
        default:
            error("Property access is not supported.");
            break;
    }
}

void Compiler::named_variable(const Token& name, bool can_assign) {
    OpCode get_op;
    OpCode set_op;
    uint16_t arg;

    int slot = resolve_local(*scope_, name);
    if (slot != -1) {
        arg = static_cast<uint16_t>(slot);
        get_op = OpCode::OP_GET_LOCAL;
        set_op = OpCode::OP_SET_LOCAL;
    } else if ((slot = resolve_upvalue(*scope_, name)) != -1) {
        arg = static_cast<uint16_t>(slot);
        get_op = OpCode::OP_GET_UPVALUE;
        set_op = OpCode::OP_SET_UPVALUE;
    } else {
        arg = identifier_constant(name);
        get_op = OpCode::OP_GET_GLOBAL;
        set_op = OpCode::OP_SET_GLOBAL;
    }

    if (can_assign && match(TokenType::Equal)) {
        expression();
        emit_op(set_op, name.line);
    } else {
        emit_op(get_op, name.line);
    }
    emit_short(arg);
}

// ---- Scopes ----

void Compiler::begin_scope() {
    scope_->scope_depth++;
}

void Compiler::end_scope() {
    auto& locals = scope_->locals;
    scope_->scope_depth--;
    // depth -1 means the declaration was abandoned after an error.
    while (!locals.empty() &&
           (locals.back().depth > scope_->scope_depth || locals.back().depth == -1)) {
        if (locals.back().is_captured) {
            emit_op(OpCode::OP_CLOSE_UPVALUE);
        } else {
            emit_op(OpCode::OP_POP);
        }
        locals.pop_back();
    }
}

void Compiler::declare_variable() {
    if (scope_->scope_depth == 0) {
        return;
    }
    declare_local(previous_.lexeme);
}

void Compiler::declare_local(std::string_view name) {
    auto& locals = scope_->locals;
    for (auto it = locals.rbegin(); it != locals.rend(); ++it) {
        if (it->depth != -1 && it->depth < scope_->scope_depth) {
            break;
        }
        if (it->name == name) {
            error("Already a variable with this name in this scope.");
            return;
        }
    }

    if (locals.size() >= MAX_LOCALS) {
        error("Too many local variables in function.");
        return;
    }

    locals.push_back(Local{name, -1, false});
}

void Compiler::mark_initialized() {
    if (scope_->scope_depth == 0 || scope_->locals.empty()) {
        return;
    }
    scope_->locals.back().depth = scope_->scope_depth;
}

uint16_t Compiler::parse_variable(const char* message) {
    consume(TokenType::Identifier, message);

    declare_variable();
    if (scope_->scope_depth > 0) return 0;

    return identifier_constant(previous_);
}

void Compiler::define_variable(uint16_t global) {
    if (scope_->scope_depth > 0) {
        mark_initialized();
        return;
    }
    emit_op_short(OpCode::OP_DEFINE_GLOBAL, global);
}

int Compiler::resolve_local(FunctionScope& scope, const Token& name) {
    for (int i = static_cast<int>(scope.locals.size()) - 1; i >= 0; --i) {
        const Local& local = scope.locals[static_cast<size_t>(i)];
        if (local.name == name.lexeme) {
            if (local.depth == -1) {
                error("Can't read local variable in its own initializer.");
            }
            return i;
        }
    }
    return -1;
}

int Compiler::resolve_upvalue(FunctionScope& scope, const Token& name) {
    if (scope.enclosing == nullptr) {
        return -1;
    }

    // Check if the variable is a local in the enclosing function
    int local = resolve_local(*scope.enclosing, name);
    if (local != -1) {
        scope.enclosing->locals[static_cast<size_t>(local)].is_captured = true;
        return add_upvalue(scope, static_cast<uint16_t>(local), true);
    }

    // Check if the variable is an upvalue in the enclosing function
    int upvalue = resolve_upvalue(*scope.enclosing, name);
    if (upvalue != -1) {
        return add_upvalue(scope, static_cast<uint16_t>(upvalue), false);
    }

    return -1;
}

int Compiler::add_upvalue(FunctionScope& scope, uint16_t index, bool is_local) {
    // Check if this upvalue already exists
    for (size_t i = 0; i < scope.upvalues.size(); ++i) {
        if (scope.upvalues[i].index == index && scope.upvalues[i].is_local == is_local) {
            return static_cast<int>(i);
        }
    }

    if (scope.upvalues.size() >= MAX_UPVALUES) {
        error("Too many closure variables in function.");
        return 0;
    }

    scope.upvalues.push_back(UpvalueInfo{index, is_local});
    return static_cast<int>(scope.upvalues.size() - 1);
}

// ---- Emission ----

void Compiler::emit_op(OpCode op) {
    emit_op(op, previous_.line);
}

void Compiler::emit_op(OpCode op, uint32_t line) {
    current_chunk().write_op(op, line);
}

void Compiler::emit_byte(uint8_t byte) {
    // Operand bytes share the line of their opcode.
    Chunk& chunk = current_chunk();
    chunk.write(byte, chunk.lines.empty() ? previous_.line : chunk.lines.back());
}

void Compiler::emit_short(uint16_t value) {
    emit_byte(static_cast<uint8_t>((value >> 8) & 0xff));
    emit_byte(static_cast<uint8_t>(value & 0xff));
}

void Compiler::emit_op_short(OpCode op, uint16_t operand) {
    emit_op(op);
    emit_short(operand);
}

uint16_t Compiler::checked_index(size_t index) {
    if (index > std::numeric_limits<uint16_t>::max()) {
        // Reported once per function; later overflows would only repeat it.
        if (!scope_->pool_overflow_reported) {
            scope_->pool_overflow_reported = true;
            error("Too many constants in one chunk.");
        }
        return 0;
    }
    return static_cast<uint16_t>(index);
}

void Compiler::emit_constant(Number value) {
    emit_op_short(OpCode::OP_CONSTANT, checked_index(current_chunk().add_constant(value)));
}

void Compiler::emit_string(std::string_view value) {
    emit_op_short(OpCode::OP_STRING, checked_index(current_chunk().add_string(std::string(value))));
}

uint16_t Compiler::identifier_constant(const Token& name) {
    return checked_index(current_chunk().add_string(std::string(name.lexeme)));
}

size_t Compiler::emit_jump(OpCode op) {
    return current_chunk().emit_jump(op, previous_.line);
}

void Compiler::patch_jump(size_t offset) {
    if (!current_chunk().patch_jump(offset)) {
        error("Too much code to jump over.");
    }
}

void Compiler::emit_loop(size_t loop_start) {
    emit_op(OpCode::OP_LOOP);

    size_t offset = current_chunk().code_size() - loop_start + 2;
    if (offset > std::numeric_limits<uint16_t>::max()) {
        error("Loop body too large.");
        offset = 0;
    }
    emit_short(static_cast<uint16_t>(offset));
}

void Compiler::emit_return() {
    emit_op(OpCode::OP_NIL);
    emit_op(OpCode::OP_RETURN);
}

FunctionPrototype Compiler::end_function() {
    emit_return();

    FunctionPrototype proto;
    proto.name = scope_->kind == FunctionKind::Script ? std::string() : scope_->name;
    proto.arity = scope_->arity;
    proto.upvalues = scope_->upvalues;
    proto.chunk = scope_->chunk;
    return proto;
}

} // namespace loxvm
