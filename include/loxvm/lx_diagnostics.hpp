// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_diagnostics.hpp
 * @brief Compile and runtime diagnostics as plain text or JSON.
 */

#pragma once

#include "lx_runner.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace loxvm {

struct DiagnosticItem {
    enum class Kind { Compile, Runtime } kind = Kind::Compile;
    uint32_t line = 0;
    std::string message;
    std::vector<std::string> stack_trace;  // runtime errors only
};

std::vector<DiagnosticItem> CollectDiagnostics(const InterpretResult& result);

// {"diagnostics":[{"severity":"error","kind":...,"line":N,"message":"..."}]}
// Every item is an error; "severity" is kept for LSP-style consumers.
nlohmann::json DiagnosticsToJson(const std::vector<DiagnosticItem>& diags);

// One line per compile error, or the runtime message and its stack trace.
std::string DiagnosticsToText(const InterpretResult& result);

} // namespace loxvm
