// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file test_helpers.hpp
 * @brief Shared helpers for running Lox source inside tests.
 */

#pragma once

#include "loxvm/lx_runner.hpp"
#include "loxvm/lx_vm.hpp"

#include <sstream>
#include <string>
#include <string_view>

namespace loxvm {
namespace test {

// Outcome of one run: the interpreter result plus everything `print` wrote.
struct RunOutput {
    InterpretResult result;
    std::string output;

    bool ok() const { return result.ok(); }

    std::string runtime_message() const {
        return result.runtime_error ? std::string(result.runtime_error->what()) : std::string();
    }
};

// Runs `source` on an existing VM, capturing printed output.
inline RunOutput run_on(VM& vm, std::string_view source, CompileOptions options = CompileOptions{}) {
    std::ostringstream out;
    std::ostream* previous = &vm.output();
    vm.set_output(out);
    RunOutput run;
    run.result = Interpret(vm, source, options);
    vm.set_output(*previous);
    run.output = out.str();
    return run;
}

// Runs `source` on a fresh VM.
inline RunOutput run_code(std::string_view source, VMConfig config = VMConfig{}) {
    VM vm(config);
    return run_on(vm, source);
}

// Runs `source` with a collection at every instruction boundary.
inline RunOutput run_stressed(std::string_view source) {
    VMConfig config;
    config.stress_gc = true;
    return run_code(source, config);
}

} // namespace test
} // namespace loxvm
