// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_runner.hpp
 * @brief Compile-and-run helpers and process exit codes.
 *
 * Compiles and runs Lox source on a VM in a single call and reports the
 * outcome as an InterpretResult instead of an exception.
 */

#pragma once

#include "lx_compiler.hpp"
#include "lx_vm.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loxvm {

// Process exit codes used by the command line front end
inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 64;
inline constexpr int kExitCompileError = 65;
inline constexpr int kExitNoInput = 66;
inline constexpr int kExitRuntimeError = 70;

struct InterpretResult {
    enum class Status {
        Ok,
        CompileError,
        RuntimeError
    };

    Status status{Status::Ok};
    std::vector<CompileError> compile_errors;
    std::optional<RuntimeError> runtime_error;

    bool ok() const { return status == Status::Ok; }
    int exit_code() const;
};

// Called between compiling and running. Returning false skips the run.
using BeforeRunHook = std::function<bool(const FunctionPrototype& script)>;

// Compiles and executes source code in one step. Globals defined by the
// source stay in `vm` afterwards.
InterpretResult Interpret(VM& vm, std::string_view source, CompileOptions options = CompileOptions{},
                          const BeforeRunHook& before_run = nullptr);

// Runs an already compiled script on `vm`.
InterpretResult Execute(VM& vm, const FunctionPrototype& script);

// Compiles without running. On failure returns nullopt and fills `errors`.
std::optional<FunctionPrototype> CompileSource(std::string_view source,
                                               CompileOptions options,
                                               std::vector<CompileError>& errors);

// Reads a whole file. Returns nullopt if it cannot be opened.
std::optional<std::string> ReadSourceFile(const std::filesystem::path& path);

} // namespace loxvm
