// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_compiler.hpp
 * @brief Single-pass Pratt compiler from source text to bytecode.
 *
 * The compiler pulls tokens from the Lexer one at a time and emits
 * bytecode for the innermost function being compiled. Each function
 * literal gets its own FunctionScope (locals, upvalues, Chunk) linked to
 * the enclosing one. Errors are collected with panic-mode recovery so a
 * single pass can report several of them.
 */

#pragma once

#include "lx_chunk.hpp"
#include "lx_lexer.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace loxvm {

class CompilerError : public std::runtime_error {
public:
    CompilerError(const std::string& msg, uint32_t line = 0)
        : std::runtime_error(line > 0 ? msg + " (line " + std::to_string(line) + ")" : msg)
        , message_(msg)
        , line_(line) {}

    uint32_t line() const { return line_; }
    const std::string& message() const { return message_; }

private:
    std::string message_;
    uint32_t line_;
};

// One reported compile error.
struct CompileError {
    uint32_t line{0};
    std::string location;  // " at 'tok'", " at end" or empty
    std::string message;

    // "[line N] Error at 'tok': message"
    std::string to_string() const;
};

struct CompileOptions {
    // A trailing expression without ';' at end of input is printed.
    bool repl_mode = false;
};

class Compiler {
public:
    explicit Compiler(CompileOptions options = CompileOptions{});

    // Compiles a whole program into the script prototype. Returns nullopt
    // when any error was reported; see errors().
    std::optional<FunctionPrototype> compile(std::string_view source);

    const std::vector<CompileError>& errors() const { return errors_; }
    bool had_error() const { return !errors_.empty(); }

    static constexpr int MAX_RECURSION_DEPTH = 256;
    static constexpr size_t MAX_LOCALS = 256;
    static constexpr size_t MAX_UPVALUES = 256;
    static constexpr int MAX_ARGUMENTS = 255;

private:
    enum class FunctionKind {
        Script,
        Function
    };

    struct Local {
        std::string_view name{};
        int depth{};                // -1 while the initializer is compiled
        bool is_captured{false};    // True if captured by closure
    };

    struct FunctionScope {
        FunctionScope* enclosing{nullptr};
        FunctionKind kind{FunctionKind::Script};
        std::string name;
        int arity{0};
        std::shared_ptr<Chunk> chunk{std::make_shared<Chunk>()};
        std::vector<Local> locals;
        std::vector<UpvalueInfo> upvalues;
        int scope_depth{0};
        bool pool_overflow_reported{false};
    };

    // Precedence levels, lowest to highest
    enum class Precedence {
        None,
        Assignment,  // =
        Or,          // or
        And,         // and
        Equality,    // == !=
        Comparison,  // < > <= >=
        Term,        // + -
        Factor,      // * /
        Unary,       // ! - typeof
        Call,        // ()
        Primary
    };

    using ParseFn = void (Compiler::*)(bool can_assign);

    struct ParseRule {
        ParseFn prefix;
        ParseFn infix;
        Precedence precedence;
    };

    CompileOptions options_;
    Lexer lexer_{""};
    Token current_;
    Token previous_;
    bool panic_mode_{false};
    std::vector<CompileError> errors_;
    FunctionScope* scope_{nullptr};
    int recursion_depth_{0};

    static const ParseRule& get_rule(TokenType type);

    // ---- Token stream ----
    void advance();
    void consume(TokenType type, const char* message);
    bool check(TokenType type) const;
    bool match(TokenType type);

    // ---- Error reporting ----
    void error_at(const Token& token, const std::string& message);
    void error(const std::string& message);
    void error_at_current(const std::string& message);
    void synchronize();

    // ---- Declarations & statements ----
    void declaration();
    void fun_declaration();
    void var_declaration();
    void class_declaration();
    void statement();
    void print_statement();
    void if_statement();
    void while_statement();
    void for_statement();
    void return_statement();
    void expression_statement();
    void block();
    void function(FunctionKind kind);

    // ---- Expressions ----
    void expression();
    void parse_precedence(Precedence precedence);
    void number(bool can_assign);
    void string(bool can_assign);
    void literal(bool can_assign);
    void grouping(bool can_assign);
    void unary(bool can_assign);
    void binary(bool can_assign);
    void and_(bool can_assign);
    void or_(bool can_assign);
    void call(bool can_assign);
    void variable(bool can_assign);
    void unsupported(bool can_assign);
    void named_variable(const Token& name, bool can_assign);
    uint8_t argument_list();

    // ---- Scopes ----
    void begin_scope();
    void end_scope();
    void declare_variable();
    void declare_local(std::string_view name);
    void mark_initialized();
    uint16_t parse_variable(const char* message);
    void define_variable(uint16_t global);
    int resolve_local(FunctionScope& scope, const Token& name);
    int resolve_upvalue(FunctionScope& scope, const Token& name);
    int add_upvalue(FunctionScope& scope, uint16_t index, bool is_local);

    // ---- Emission ----
    Chunk& current_chunk() { return *scope_->chunk; }
    void emit_op(OpCode op);
    void emit_op(OpCode op, uint32_t line);
    void emit_byte(uint8_t byte);
    void emit_short(uint16_t value);
    void emit_op_short(OpCode op, uint16_t operand);
    void emit_constant(Number value);
    void emit_string(std::string_view value);
    uint16_t identifier_constant(const Token& name);
    uint16_t checked_index(size_t index);
    size_t emit_jump(OpCode op);
    void patch_jump(size_t offset);
    void emit_loop(size_t loop_start);
    void emit_return();
    FunctionPrototype end_function();

    // Helper classes
    class RecursionGuard {
    public:
        explicit RecursionGuard(Compiler& compiler) : compiler_(compiler) {
            if (++compiler_.recursion_depth_ > MAX_RECURSION_DEPTH) {
                --compiler_.recursion_depth_;
                throw CompilerError("Maximum nesting depth exceeded", compiler_.previous_.line);
            }
        }
        ~RecursionGuard() {
            --compiler_.recursion_depth_;
        }
        RecursionGuard(const RecursionGuard&) = delete;
        RecursionGuard& operator=(const RecursionGuard&) = delete;

    private:
        Compiler& compiler_;
    };

    // Makes `scope` current and restores the enclosing one on exit.
    class ScopeGuard {
    public:
        ScopeGuard(Compiler& compiler, FunctionScope& scope)
            : compiler_(compiler), saved_(compiler.scope_) {
            scope.enclosing = saved_;
            compiler_.scope_ = &scope;
        }
        ~ScopeGuard() {
            compiler_.scope_ = saved_;
        }
        ScopeGuard(const ScopeGuard&) = delete;
        ScopeGuard& operator=(const ScopeGuard&) = delete;

    private:
        Compiler& compiler_;
        FunctionScope* saved_;
    };
};

} // namespace loxvm
