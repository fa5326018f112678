// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file test_compiler.cpp
 * @brief Compile errors and emitted code shape.
 */

#include <gtest/gtest.h>

#include "loxvm/lx_compiler.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace loxvm;

namespace {

std::vector<std::string> compile_errors(std::string_view source, CompileOptions options = CompileOptions{}) {
    Compiler compiler(options);
    auto script = compiler.compile(source);
    EXPECT_FALSE(script.has_value());
    std::vector<std::string> out;
    for (const auto& err : compiler.errors()) {
        out.push_back(err.to_string());
    }
    return out;
}

std::string single_error(std::string_view source) {
    auto errors = compile_errors(source);
    EXPECT_EQ(errors.size(), 1u);
    return errors.empty() ? std::string() : errors.front();
}

} // namespace

TEST(CompilerTests, ScriptPrototype) {
    Compiler compiler;
    auto script = compiler.compile("var a = 1;");
    ASSERT_TRUE(script.has_value());
    EXPECT_FALSE(compiler.had_error());
    EXPECT_TRUE(script->name.empty());
    EXPECT_EQ(script->arity, 0);
    ASSERT_NE(script->chunk, nullptr);
    EXPECT_EQ(script->chunk->code.back(), static_cast<uint8_t>(OpCode::OP_RETURN));
}

TEST(CompilerTests, FunctionPrototypeRecordsArity) {
    Compiler compiler;
    auto script = compiler.compile("fun add(a, b, c) { return a + b + c; }");
    ASSERT_TRUE(script.has_value());
    ASSERT_EQ(script->chunk->functions.size(), 1u);
    EXPECT_EQ(script->chunk->functions[0].name, "add");
    EXPECT_EQ(script->chunk->functions[0].arity, 3);
    EXPECT_TRUE(script->chunk->functions[0].upvalues.empty());
}

TEST(CompilerTests, ReportsEveryStatementError) {
    auto errors = compile_errors("print 1 +;\nvar = 2;\nprint 3;");
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "[line 1] Error at ';': Expect expression.");
    EXPECT_EQ(errors[1], "[line 2] Error at '=': Expect variable name.");
}

TEST(CompilerTests, ErrorAtEnd) {
    EXPECT_EQ(single_error("print 1"), "[line 1] Error at end: Expect ';' after value.");
}

TEST(CompilerTests, LexicalErrorHasNoLocation) {
    EXPECT_EQ(single_error("print \"abc"), "[line 1] Error: Unterminated string.");
}

TEST(CompilerTests, InvalidAssignmentTarget) {
    EXPECT_EQ(single_error("var a; var b; a + b = 3;"),
              "[line 1] Error at '=': Invalid assignment target.");
}

TEST(CompilerTests, ReturnFromTopLevel) {
    EXPECT_EQ(single_error("return 1;"),
              "[line 1] Error at 'return': Can't return from top-level code.");
}

TEST(CompilerTests, LocalInOwnInitializer) {
    EXPECT_EQ(single_error("{ var a = a; }"),
              "[line 1] Error at 'a': Can't read local variable in its own initializer.");
}

TEST(CompilerTests, GlobalInOwnInitializerIsAllowed) {
    Compiler compiler;
    EXPECT_TRUE(compiler.compile("var a = 1; var a = a;").has_value());
}

TEST(CompilerTests, DuplicateLocal) {
    EXPECT_EQ(single_error("{ var a = 1; var a = 2; }"),
              "[line 1] Error at 'a': Already a variable with this name in this scope.");
}

TEST(CompilerTests, ShadowingInInnerBlockIsAllowed) {
    Compiler compiler;
    EXPECT_TRUE(compiler.compile("{ var a = 1; { var a = 2; } }").has_value());
}

TEST(CompilerTests, TooManyLocals) {
    std::string source = "fun f() {\n";
    for (int i = 0; i < 256; ++i) {
        source += "var v" + std::to_string(i) + ";\n";
    }
    source += "}\n";
    auto errors = compile_errors(source);
    ASSERT_FALSE(errors.empty());
    EXPECT_NE(errors[0].find("Too many local variables in function."), std::string::npos);
}

namespace {

bool mentions(const std::vector<std::string>& errors, std::string_view message) {
    for (const auto& err : errors) {
        if (err.find(message) != std::string::npos) return true;
    }
    return false;
}

// `count` copies of `print 1;`, four bytes of code each.
std::string repeated_prints(int count) {
    std::string body;
    for (int i = 0; i < count; ++i) {
        body += "print 1;\n";
    }
    return body;
}

} // namespace

TEST(CompilerTests, TooManyConstantsReportedOnce) {
    std::string source;
    for (int i = 0; i < 70000; ++i) {
        source += "print " + std::to_string(i) + ";\n";
    }
    auto errors = compile_errors(source);
    ASSERT_FALSE(errors.empty());
    EXPECT_NE(errors[0].find("Too many constants in one chunk."), std::string::npos);

    size_t repeats = 0;
    for (const auto& err : errors) {
        if (err.find("Too many constants in one chunk.") != std::string::npos) ++repeats;
    }
    EXPECT_EQ(repeats, 1u);
}

TEST(CompilerTests, TooManyClosureVariables) {
    // 400 captures from two enclosing functions, each under the local limit.
    std::string source = "fun outer() {\n";
    for (int i = 0; i < 200; ++i) {
        source += "var a" + std::to_string(i) + ";\n";
    }
    source += "fun middle() {\n";
    for (int i = 0; i < 200; ++i) {
        source += "var b" + std::to_string(i) + ";\n";
    }
    source += "fun inner() {\n";
    for (int i = 0; i < 200; ++i) {
        source += "b" + std::to_string(i) + ";\n";
        source += "a" + std::to_string(i) + ";\n";
    }
    source += "}\n}\n}\n";

    auto errors = compile_errors(source);
    ASSERT_FALSE(errors.empty());
    EXPECT_NE(errors[0].find("Too many closure variables in function."), std::string::npos);
}

TEST(CompilerTests, JumpOverTooMuchCode) {
    auto errors = compile_errors("if (true) {\n" + repeated_prints(17000) + "}\n");
    ASSERT_FALSE(errors.empty());
    EXPECT_TRUE(mentions(errors, "Too much code to jump over."));
}

TEST(CompilerTests, LoopBodyTooLarge) {
    auto errors = compile_errors("while (false) {\n" + repeated_prints(17000) + "}\n");
    ASSERT_FALSE(errors.empty());
    EXPECT_TRUE(mentions(errors, "Loop body too large."));
}

TEST(CompilerTests, TooManyArguments) {
    std::string source = "fun f() {} f(";
    for (int i = 0; i < 256; ++i) {
        source += i == 0 ? "0" : ", 0";
    }
    source += ");";
    auto errors = compile_errors(source);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("Can't have more than 255 arguments."), std::string::npos);
}

TEST(CompilerTests, TooManyParameters) {
    std::string source = "fun f(";
    for (int i = 0; i < 256; ++i) {
        source += (i == 0 ? "p" : ", p") + std::to_string(i);
    }
    source += ") {}";
    auto errors = compile_errors(source);
    ASSERT_FALSE(errors.empty());
    EXPECT_NE(errors[0].find("Can't have more than 255 parameters."), std::string::npos);
}

TEST(CompilerTests, DeepNestingIsAnError) {
    std::string source = "print " + std::string(400, '(') + "1" + std::string(400, ')') + ";";
    auto errors = compile_errors(source);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("Maximum nesting depth exceeded"), std::string::npos);
}

TEST(CompilerTests, ClassesAreRejected) {
    auto errors = compile_errors("class Point { init(x) { this.x = x; } }\nprint 1;");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "[line 1] Error at 'class': Classes are not supported.");
}

TEST(CompilerTests, ThisSuperAndPropertiesAreRejected) {
    EXPECT_EQ(single_error("print this;"),
              "[line 1] Error at 'this': Can't use 'this': classes are not supported.");
    EXPECT_EQ(single_error("print super;"),
              "[line 1] Error at 'super': Can't use 'super': classes are not supported.");
    EXPECT_EQ(single_error("var a; print a.b;"),
              "[line 1] Error at '.': Property access is not supported.");
}

TEST(CompilerTests, TrailingExpressionNeedsReplMode) {
    EXPECT_EQ(single_error("1 + 2"), "[line 1] Error at end: Expect ';' after expression.");

    CompileOptions options;
    options.repl_mode = true;
    Compiler compiler(options);
    auto script = compiler.compile("1 + 2");
    ASSERT_TRUE(script.has_value());
    const auto& code = script->chunk->code;
    // ... OP_ADD OP_PRINT OP_NIL OP_RETURN
    ASSERT_GE(code.size(), 3u);
    EXPECT_EQ(code[code.size() - 3], static_cast<uint8_t>(OpCode::OP_PRINT));
}

TEST(CompilerTests, ReplModeStillRequiresSemicolonMidInput) {
    CompileOptions options;
    options.repl_mode = true;
    auto errors = compile_errors("1 + 2 print 3;", options);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "[line 1] Error at 'print': Expect ';' after expression.");
}

TEST(CompilerTests, UnclosedBlockReportsAtEnd) {
    EXPECT_EQ(single_error("{ print 1;"), "[line 1] Error at end: Expect '}' after block.");
}

TEST(CompilerTests, CompilerCanBeReused) {
    Compiler compiler;
    EXPECT_FALSE(compiler.compile("print ;").has_value());
    EXPECT_TRUE(compiler.had_error());
    EXPECT_TRUE(compiler.compile("print 1;").has_value());
    EXPECT_FALSE(compiler.had_error());
}
