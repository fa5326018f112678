// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_diagnostics.cpp
 * @brief Diagnostic collection and rendering.
 */

#include "loxvm/lx_diagnostics.hpp"

namespace loxvm {

std::vector<DiagnosticItem> CollectDiagnostics(const InterpretResult& result) {
    std::vector<DiagnosticItem> diags;
    for (const auto& err : result.compile_errors) {
        DiagnosticItem d;
        d.kind = DiagnosticItem::Kind::Compile;
        d.line = err.line;
        d.message = err.location.empty() ? err.message : "Error" + err.location + ": " + err.message;
        diags.push_back(std::move(d));
    }
    if (result.runtime_error) {
        DiagnosticItem d;
        d.kind = DiagnosticItem::Kind::Runtime;
        d.line = result.runtime_error->line();
        d.message = result.runtime_error->what();
        d.stack_trace = result.runtime_error->stack_trace();
        diags.push_back(std::move(d));
    }
    return diags;
}

nlohmann::json DiagnosticsToJson(const std::vector<DiagnosticItem>& diags) {
    using json = nlohmann::json;
    json arr = json::array();
    for (const auto& d : diags) {
        json item;
        item["severity"] = "error";
        item["kind"] = d.kind == DiagnosticItem::Kind::Compile ? "compile" : "runtime";
        item["line"] = d.line;
        item["message"] = d.message;
        if (!d.stack_trace.empty()) {
            item["stackTrace"] = d.stack_trace;
        }
        arr.push_back(std::move(item));
    }
    json doc;
    doc["diagnostics"] = std::move(arr);
    return doc;
}

std::string DiagnosticsToText(const InterpretResult& result) {
    std::string text;
    for (const auto& err : result.compile_errors) {
        text += err.to_string();
        text += "\n";
    }
    if (result.runtime_error) {
        text += result.runtime_error->report();
        text += "\n";
    }
    return text;
}

} // namespace loxvm
