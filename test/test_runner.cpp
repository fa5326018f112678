// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file test_runner.cpp
 * @brief One-call interpretation, exit codes and diagnostics output.
 */

#include <gtest/gtest.h>

#include "loxvm/lx_diagnostics.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace loxvm;
using namespace loxvm::test;

TEST(RunnerTests, ExitCodes) {
    EXPECT_EQ(run_code("print 1;").result.exit_code(), kExitOk);
    EXPECT_EQ(run_code("print ;").result.exit_code(), kExitCompileError);
    EXPECT_EQ(run_code("print nope;").result.exit_code(), kExitRuntimeError);
}

TEST(RunnerTests, CompileErrorsPreventExecution) {
    auto run = run_code("print \"before\";\nprint 1 +;");
    EXPECT_EQ(run.result.status, InterpretResult::Status::CompileError);
    EXPECT_EQ(run.output, "");
    ASSERT_EQ(run.result.compile_errors.size(), 1u);
    EXPECT_EQ(run.result.compile_errors[0].line, 2u);
    EXPECT_FALSE(run.result.runtime_error.has_value());
}

TEST(RunnerTests, ReplModePrintsTrailingExpression) {
    VM vm;
    CompileOptions options;
    options.repl_mode = true;

    auto first = run_on(vm, "var a = 40;", options);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.output, "");

    auto second = run_on(vm, "a + 2", options);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.output, "42\n");

    // With the semicolon it is an ordinary statement.
    auto third = run_on(vm, "a + 2;", options);
    ASSERT_TRUE(third.ok());
    EXPECT_EQ(third.output, "");
}

TEST(RunnerTests, CompileSourceFillsErrors) {
    std::vector<CompileError> errors;
    EXPECT_TRUE(CompileSource("print 1;", CompileOptions{}, errors).has_value());
    EXPECT_TRUE(errors.empty());

    EXPECT_FALSE(CompileSource("var;", CompileOptions{}, errors).has_value());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].message, "Expect variable name.");
    EXPECT_EQ(errors[0].location, " at ';'");
}

TEST(RunnerTests, BeforeRunHookSeesCompiledScript) {
    VM vm;
    std::ostringstream out;
    vm.set_output(out);

    size_t code_size = 0;
    auto skipped = Interpret(vm, "var seen = 1; print seen;", CompileOptions{},
                             [&](const FunctionPrototype& script) {
                                 code_size = script.chunk->code_size();
                                 return false;
                             });
    EXPECT_TRUE(skipped.ok());
    EXPECT_GT(code_size, 0u);
    EXPECT_EQ(out.str(), "");
    EXPECT_FALSE(vm.has_global("seen"));

    auto ran = Interpret(vm, "print 2;", CompileOptions{}, [](const FunctionPrototype&) { return true; });
    EXPECT_TRUE(ran.ok());
    EXPECT_EQ(out.str(), "2\n");

    // Compile errors never reach the hook.
    bool called = false;
    auto failed = Interpret(vm, "print ;", CompileOptions{}, [&](const FunctionPrototype&) {
        called = true;
        return true;
    });
    EXPECT_EQ(failed.status, InterpretResult::Status::CompileError);
    EXPECT_FALSE(called);
}

TEST(RunnerTests, ExecuteRunsCompiledScript) {
    std::vector<CompileError> errors;
    auto script = CompileSource("counter = counter + 1; print counter;", CompileOptions{}, errors);
    ASSERT_TRUE(script.has_value());

    VM vm;
    std::ostringstream out;
    vm.set_output(out);

    auto missing = Execute(vm, *script);
    EXPECT_EQ(missing.status, InterpretResult::Status::RuntimeError);
    ASSERT_TRUE(missing.runtime_error.has_value());
    EXPECT_EQ(missing.runtime_error->what(), std::string("Undefined variable 'counter'."));

    vm.set_global("counter", Value::from_number(1));
    EXPECT_TRUE(Execute(vm, *script).ok());
    EXPECT_TRUE(Execute(vm, *script).ok());
    EXPECT_EQ(out.str(), "2\n3\n");
}

TEST(RunnerTests, ReadSourceFile) {
    const auto path = std::filesystem::temp_directory_path() / "loxvm_runner_test.lox";
    {
        std::ofstream f(path, std::ios::binary);
        f << "print \"from file\";\n";
    }
    auto source = ReadSourceFile(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(*source, "print \"from file\";\n");
    EXPECT_EQ(run_code(*source).output, "from file\n");

    EXPECT_FALSE(ReadSourceFile(path).has_value());
}

TEST(DiagnosticsTests, CompileErrorsAsJson) {
    auto run = run_code("print 1 +;\nvar = 2;");
    auto doc = DiagnosticsToJson(CollectDiagnostics(run.result));

    ASSERT_TRUE(doc.contains("diagnostics"));
    const auto& items = doc["diagnostics"];
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0]["severity"], "error");
    EXPECT_EQ(items[0]["kind"], "compile");
    EXPECT_EQ(items[0]["line"], 1);
    EXPECT_EQ(items[0]["message"], "Error at ';': Expect expression.");
    EXPECT_EQ(items[1]["line"], 2);
    EXPECT_FALSE(items[0].contains("stackTrace"));
}

TEST(DiagnosticsTests, RuntimeErrorAsJson) {
    auto run = run_code("fun f() { return -nil; }\nf();");
    auto doc = DiagnosticsToJson(CollectDiagnostics(run.result));

    const auto& items = doc["diagnostics"];
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0]["kind"], "runtime");
    EXPECT_EQ(items[0]["line"], 1);
    EXPECT_EQ(items[0]["message"], "Operand must be a number.");
    ASSERT_TRUE(items[0].contains("stackTrace"));
    EXPECT_EQ(items[0]["stackTrace"].size(), 2u);
    EXPECT_EQ(items[0]["stackTrace"][1], "[line 2] in script");
}

TEST(DiagnosticsTests, TextReport) {
    auto compile = run_code("print ;");
    EXPECT_EQ(DiagnosticsToText(compile.result), "[line 1] Error at ';': Expect expression.\n");

    auto runtime = run_code("print x;");
    EXPECT_EQ(DiagnosticsToText(runtime.result), "Undefined variable 'x'.\n[line 1] in script\n");
}

TEST(DiagnosticsTests, CleanRunHasNoDiagnostics) {
    auto run = run_code("print 1;");
    EXPECT_TRUE(CollectDiagnostics(run.result).empty());
    EXPECT_EQ(DiagnosticsToJson({}).dump(), R"({"diagnostics":[]})");
}
