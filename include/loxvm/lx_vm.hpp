// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_vm.hpp
 * @brief Stack-based virtual machine.
 *
 * The VM owns the operand stack, call frames, globals and the object
 * heap. Dispatch goes through a 256-entry table of OpCodeHandler
 * specializations built at compile time from lx_opcodes.def.
 */

#pragma once

#include "lx_core.hpp"
#include "lx_value.hpp"
#include "lx_chunk.hpp"
#include "lx_heap.hpp"

#include <array>
#include <ostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace loxvm {
    // Primary OpCodeHandler template. Specializations in
    // `lx_vm_opcodes.inl` override `execute`.
    template<OpCode op>
    struct OpCodeHandler {
        static void execute(VM& vm) {
            (void)vm;
            throw InternalError("Unhandled opcode (no handler specialization)");
        }
    };

    // Limits and debug switches, fixed at construction
    struct VMConfig {
        size_t initial_stack_size = 256;
        size_t max_stack_size = 65536;
        size_t max_call_depth = 256;
        size_t gc_initial_threshold = 1024 * 1024;
        size_t gc_growth_factor = 2;
        bool stress_gc = false;         // Collect at every safe point
        bool enable_debug = false;      // Print memory stats on shutdown
        bool trace_execution = false;   // Dump stack and instructions to stderr
    };

    // Active invocation of a closure
    struct CallFrame {
        ClosureObject* closure;
        size_t ip;
        size_t stack_base;  // Slot of the callee; locals follow
    };

    // Error raised by the running program. The VM fills in the line and
    // the call stack before it leaves interpret().
    class RuntimeError : public std::runtime_error {
    public:
        explicit RuntimeError(const std::string& msg)
            : std::runtime_error(msg) {}

        uint32_t line() const { return line_; }
        const std::vector<std::string>& stack_trace() const { return stack_trace_; }

        void set_location(uint32_t line, std::vector<std::string> trace) {
            line_ = line;
            stack_trace_ = std::move(trace);
        }

        // Message followed by one "[line N] in ..." entry per frame.
        std::string report() const;

    private:
        uint32_t line_{0};
        std::vector<std::string> stack_trace_;
    };

    class VM : public GcRootSource {
        template<OpCode op>
        friend struct OpCodeHandler;

    private:
        VMConfig config_;
        Heap heap_;

        // Execution state
        std::vector<Value> stack_;
        std::vector<CallFrame> call_frames_;
        UpvalueObject* open_upvalues_{ nullptr };  // Sorted by slot, highest first

        // Global scope, keyed by interned name
        std::unordered_map<StringObject*, Value> globals_;

        std::ostream* out_;

    public:
        explicit VM(VMConfig config = VMConfig{});
        ~VM() override;

        // Prevent copying
        VM(const VM&) = delete;
        VM& operator=(const VM&) = delete;

        // Stack operations
        void push(Value val);
        Value pop();
        Value peek(size_t offset = 0) const;
        size_t stack_size() const { return stack_.size(); }
        size_t frame_count() const { return call_frames_.size(); }

        // Global variables
        void set_global(std::string_view name, Value val);
        std::optional<Value> get_global(std::string_view name);
        bool has_global(std::string_view name);

        // Registers a host function as a global.
        void define_native(std::string_view name, int arity, NativeFn fn);

        // Runs a compiled script. Throws RuntimeError (with line and stack
        // trace filled in) after resetting the stack; globals are kept.
        void interpret(const FunctionPrototype& script);

        // For natives: abort the current call with a runtime error.
        [[noreturn]] void runtime_error(const std::string& message);

        StringObject* intern(std::string_view text) { return heap_.intern(text); }

        // Output stream used by `print` (std::cout by default)
        void set_output(std::ostream& out) { out_ = &out; }
        std::ostream& output() { return *out_; }

        // Memory
        Heap& heap() { return heap_; }
        void collect_garbage() { heap_.collect(); }
        const MemoryStats& get_stats() const { return heap_.stats(); }
        void print_stats(std::ostream& out) const;

        // Configuration
        const VMConfig& config() const { return config_; }

        void mark_roots(Heap& heap) override;

    private:
        void run();
        uint8_t read_byte();
        uint16_t read_short();
        Value read_constant();
        StringObject* read_string();
        CallFrame& frame() { return call_frames_.back(); }
        const Chunk& current_chunk() const;
        size_t current_stack_base() const;

        void call_value(Value callee, uint8_t arg_count);
        void call_closure(ClosureObject* closure, uint8_t arg_count);

        UpvalueObject* capture_upvalue(size_t slot);
        void close_upvalues(size_t last);
        Value& upvalue_ref(UpvalueObject* upvalue);

        uint32_t current_line() const;
        std::vector<std::string> build_stack_trace() const;
        void reset_stack();
        void trace_instruction() const;
        void define_builtins();
    };

    // Dispatch table indexed by opcode byte
    using OpHandlerFunc = void(*)(VM&);
    extern const std::array<OpHandlerFunc, 256> g_opcode_handlers;

    constexpr std::array<OpHandlerFunc, 256> make_handler_table();

} // namespace loxvm

#include "lx_vm_opcodes.inl"
