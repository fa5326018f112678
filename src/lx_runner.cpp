// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_runner.cpp
 * @brief Compile-and-run helpers.
 */

#include "loxvm/lx_runner.hpp"

#include <fstream>
#include <iterator>

namespace loxvm {

int InterpretResult::exit_code() const {
    switch (status) {
        case Status::Ok:           return kExitOk;
        case Status::CompileError: return kExitCompileError;
        case Status::RuntimeError: return kExitRuntimeError;
    }
    return kExitRuntimeError;
}

std::optional<FunctionPrototype> CompileSource(std::string_view source,
                                               CompileOptions options,
                                               std::vector<CompileError>& errors) {
    Compiler compiler(options);
    auto script = compiler.compile(source);
    errors = compiler.errors();
    return script;
}

InterpretResult Interpret(VM& vm, std::string_view source, CompileOptions options,
                          const BeforeRunHook& before_run) {
    InterpretResult result;

    auto script = CompileSource(source, options, result.compile_errors);
    if (!script) {
        result.status = InterpretResult::Status::CompileError;
        return result;
    }
    if (before_run && !before_run(*script)) {
        return result;
    }
    return Execute(vm, *script);
}

InterpretResult Execute(VM& vm, const FunctionPrototype& script) {
    InterpretResult result;
    try {
        vm.interpret(script);
    } catch (const RuntimeError& e) {
        result.status = InterpretResult::Status::RuntimeError;
        result.runtime_error = e;
    }
    return result;
}

std::optional<std::string> ReadSourceFile(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::nullopt;
    }
    std::string source;
    source.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return source;
}

} // namespace loxvm
