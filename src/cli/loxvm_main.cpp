// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file loxvm_main.cpp
 * @brief loxvm command-line interface.
 *
 * Runs a script file, or starts an interactive prompt when no file is
 * given. Entry point for the loxvm executable.
 */

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "loxvm/lx_diagnostics.hpp"
#include "loxvm/lx_disassembler.hpp"
#include "loxvm/lx_runner.hpp"
#include "loxvm/lx_vm.hpp"

using namespace loxvm;

namespace {

constexpr const char* VERSION = "0.1.0";

struct CliOptions {
    std::optional<std::filesystem::path> script;
    bool disassemble = false;
    bool compile_only = false;
    bool json_diagnostics = false;
    bool print_stats = false;
    VMConfig vm_config;
};

void print_usage(std::ostream& out) {
    out << R"(
loxvm - Lox bytecode VM v)" << VERSION << R"(

Usage: loxvm [options] [script]

With no script, starts an interactive prompt.

Options:
  -d, --disassemble       Print the bytecode listing before running
  --compile-only          Compile (and optionally disassemble) without running
  --diagnostics=json      Report errors as a JSON document on stderr
  --stats                 Print heap statistics at exit
  --stress-gc             Collect garbage at every instruction boundary
  --trace                 Trace the stack and each instruction to stderr
  --version               Show version information
  --help                  Show this help message

Exit codes: 0 ok, 64 usage, 65 compile error, 66 cannot open file,
            70 runtime error
)";
}

void print_version() {
    std::cout << "loxvm version " << VERSION << "\n";
}

void print_repl_help() {
    std::cout << "Commands:\n"
              << "  :exit          Leave the prompt\n"
              << "  :help          Show this help\n"
              << "  :dis           Toggle bytecode listing for each input\n"
              << "  :load <file>   Run a script file in this session\n"
              << "A final expression without ';' is printed.\n";
}

void report_errors(const InterpretResult& result, bool json) {
    if (json) {
        std::cerr << DiagnosticsToJson(CollectDiagnostics(result)).dump(2) << "\n";
    } else {
        std::cerr << DiagnosticsToText(result);
    }
}

// Compiles and runs one unit of source on `vm`, reporting any errors.
InterpretResult run_source(VM& vm, std::string_view source, CompileOptions compile_options,
                           const CliOptions& options, bool disassemble) {
    InterpretResult result = Interpret(vm, source, compile_options, [&](const FunctionPrototype& script) {
        if (disassemble) {
            disassemble_chunk(*script.chunk, "<script>", std::cout);
        }
        return !options.compile_only;
    });
    if (!result.ok()) {
        report_errors(result, options.json_diagnostics);
    }
    return result;
}

// True when every error sits at end of input, i.e. more lines may fix it.
bool needs_more_input(std::string_view source) {
    std::vector<CompileError> errors;
    CompileOptions compile_options;
    compile_options.repl_mode = true;
    if (CompileSource(source, compile_options, errors)) {
        return false;
    }
    for (const auto& err : errors) {
        if (err.location != " at end" && err.message != "Unterminated string.") {
            return false;
        }
    }
    return !errors.empty();
}

int run_file(const CliOptions& options) {
    auto source = ReadSourceFile(*options.script);
    if (!source) {
        std::cerr << "Error: Cannot open file: " << options.script->string() << "\n";
        return kExitNoInput;
    }

    VM vm(options.vm_config);
    InterpretResult result = run_source(vm, *source, CompileOptions{}, options, options.disassemble);
    if (options.print_stats) {
        vm.print_stats(std::cerr);
    }
    return result.exit_code();
}

int run_repl(const CliOptions& options) {
    VM vm(options.vm_config);
    bool disassemble = options.disassemble;

    CompileOptions repl_options;
    repl_options.repl_mode = true;

    std::cout << "loxvm " << VERSION << " (type :help for commands)\n";

    std::string buffer;
    std::string line;
    for (;;) {
        std::cout << (buffer.empty() ? ">>> " : "... ") << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }

        if (buffer.empty()) {
            if (line == ":exit") break;
            if (line == ":help") {
                print_repl_help();
                continue;
            }
            if (line == ":dis") {
                disassemble = !disassemble;
                std::cout << "disassembly " << (disassemble ? "on" : "off") << "\n";
                continue;
            }
            if (line.rfind(":load", 0) == 0) {
                std::string path = line.substr(5);
                path.erase(0, path.find_first_not_of(" \t"));
                if (path.empty()) {
                    std::cerr << "Usage: :load <file>\n";
                    continue;
                }
                auto source = ReadSourceFile(path);
                if (!source) {
                    std::cerr << "Error: Cannot open file: " << path << "\n";
                    continue;
                }
                run_source(vm, *source, CompileOptions{}, options, disassemble);
                continue;
            }
            if (!line.empty() && line[0] == ':') {
                std::cerr << "Unknown command '" << line << "'. Type :help for commands.\n";
                continue;
            }
        }

        buffer += line;
        buffer += "\n";

        // An empty line ends a continuation even if the input is incomplete.
        if (!line.empty() && needs_more_input(buffer)) {
            continue;
        }

        run_source(vm, buffer, repl_options, options, disassemble);
        buffer.clear();
    }

    if (options.print_stats) {
        vm.print_stats(std::cerr);
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            return kExitOk;
        } else if (arg == "--version") {
            print_version();
            return kExitOk;
        } else if (arg == "-d" || arg == "--disassemble") {
            options.disassemble = true;
        } else if (arg == "--compile-only") {
            options.compile_only = true;
        } else if (arg == "--diagnostics=json") {
            options.json_diagnostics = true;
        } else if (arg == "--stats") {
            options.print_stats = true;
        } else if (arg == "--stress-gc") {
            options.vm_config.stress_gc = true;
        } else if (arg == "--trace") {
            options.vm_config.trace_execution = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(std::cerr);
            return kExitUsage;
        } else if (!options.script) {
            options.script = arg;
        } else {
            std::cerr << "Error: Only one script may be given\n";
            print_usage(std::cerr);
            return kExitUsage;
        }
    }

    try {
        if (options.script) {
            return run_file(options);
        }
        if (options.compile_only) {
            std::cerr << "Error: --compile-only needs a script\n";
            return kExitUsage;
        }
        return run_repl(options);
    } catch (const InternalError& e) {
        std::cerr << e.what() << "\n";
        return kExitRuntimeError;
    }
}
