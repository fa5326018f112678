// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_vm.cpp
 * @brief VM execution loop, calls, upvalues and GC roots.
 */

#include "loxvm/lx_vm.hpp"
#include "loxvm/lx_disassembler.hpp"

#include <chrono>
#include <iostream>

namespace loxvm {

    // One entry per opcode byte; unused bytes stay null.
    const std::array<OpHandlerFunc, 256> g_opcode_handlers = make_handler_table();

    namespace {
        HeapConfig heap_config_from(const VMConfig& config) {
            HeapConfig heap_config;
            heap_config.initial_threshold = config.gc_initial_threshold;
            heap_config.growth_factor = config.gc_growth_factor;
            heap_config.stress = config.stress_gc;
            return heap_config;
        }
    } // namespace

    std::string RuntimeError::report() const {
        std::string text = what();
        for (const auto& entry : stack_trace_) {
            text += "\n";
            text += entry;
        }
        return text;
    }

    VM::VM(VMConfig config)
        : config_(config), heap_(heap_config_from(config)), out_(&std::cout) {
        stack_.reserve(config_.initial_stack_size);
        call_frames_.reserve(config_.max_call_depth);
        heap_.set_root_source(this);
        define_builtins();
    }

    VM::~VM() {
        if (config_.enable_debug) {
            print_stats(std::cerr);
        }
        heap_.set_root_source(nullptr);
    }

    void VM::push(Value val) {
        if (stack_.size() >= config_.max_stack_size) {
            throw RuntimeError("Stack overflow.");
        }
        stack_.push_back(val);
    }

    Value VM::pop() {
        if (stack_.empty()) {
            throw InternalError("stack underflow");
        }
        Value val = stack_.back();
        stack_.pop_back();
        return val;
    }

    Value VM::peek(size_t offset) const {
        if (offset >= stack_.size()) {
            throw InternalError("stack peek out of bounds");
        }
        return stack_[stack_.size() - 1 - offset];
    }

    void VM::set_global(std::string_view name, Value val) {
        globals_[heap_.intern(name)] = val;
    }

    std::optional<Value> VM::get_global(std::string_view name) {
        auto it = globals_.find(heap_.intern(name));
        if (it == globals_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool VM::has_global(std::string_view name) {
        return globals_.find(heap_.intern(name)) != globals_.end();
    }

    void VM::define_native(std::string_view name, int arity, NativeFn fn) {
        auto* native = heap_.allocate<NativeFunctionObject>(std::string(name), arity, std::move(fn));
        set_global(name, Value::from_object(native));
    }

    void VM::define_builtins() {
        define_native("clock", 0, [](VM&, std::span<Value>) {
            using namespace std::chrono;
            const auto now = steady_clock::now().time_since_epoch();
            return Value::from_number(duration<double>(now).count());
        });
    }

    void VM::runtime_error(const std::string& message) {
        throw RuntimeError(message);
    }

    void VM::interpret(const FunctionPrototype& script) {
        reset_stack();

        auto* function = heap_.allocate<FunctionObject>(
            script.name, script.arity, script.upvalues.size(), script.chunk);
        auto* closure = heap_.allocate<ClosureObject>(function);
        push(Value::from_object(closure));

        try {
            call_closure(closure, 0);
            run();
        } catch (RuntimeError& e) {
            e.set_location(current_line(), build_stack_trace());
            reset_stack();
            throw;
        }
    }

    void VM::run() {
        while (!call_frames_.empty()) {
            // Instruction boundary: the only place a collection may run.
            heap_.collect_if_needed();

            if (config_.trace_execution) {
                trace_instruction();
            }

            uint8_t byte = read_byte();
            if (!is_valid_opcode(byte)) {
                throw InternalError("unknown opcode " + std::to_string(byte));
            }
            auto handler = g_opcode_handlers[byte];
            if (!handler) {
                throw InternalError("no handler for opcode " + std::to_string(byte));
            }
            handler(*this);
        }
    }

    const Chunk& VM::current_chunk() const {
        return *call_frames_.back().closure->function->chunk;
    }

    uint8_t VM::read_byte() {
        CallFrame& f = frame();
        uint8_t byte = f.closure->function->chunk->read_byte(f.ip);
        f.ip += 1;
        return byte;
    }

    uint16_t VM::read_short() {
        CallFrame& f = frame();
        uint16_t value = f.closure->function->chunk->read_short(f.ip);
        f.ip += 2;
        return value;
    }

    Value VM::read_constant() {
        uint16_t index = read_short();
        const auto& constants = current_chunk().constants;
        if (index >= constants.size()) {
            throw InternalError("constant index out of range");
        }
        return constants[index];
    }

    StringObject* VM::read_string() {
        uint16_t index = read_short();
        const auto& strings = current_chunk().strings;
        if (index >= strings.size()) {
            throw InternalError("string constant index out of range");
        }
        return heap_.intern(strings[index]);
    }

    size_t VM::current_stack_base() const {
        if (call_frames_.empty()) {
            return 0;
        }
        return call_frames_.back().stack_base;
    }

    void VM::call_value(Value callee, uint8_t arg_count) {
        if (callee.is_object_type(ObjectType::Closure)) {
            call_closure(static_cast<ClosureObject*>(callee.as_object()), arg_count);
            return;
        }

        if (callee.is_object_type(ObjectType::Native)) {
            auto* native = static_cast<NativeFunctionObject*>(callee.as_object());
            if (native->arity >= 0 && native->arity != arg_count) {
                throw RuntimeError("Expected " + std::to_string(native->arity) +
                                   " arguments but got " + std::to_string(arg_count) + ".");
            }
            size_t args_begin = stack_.size() - arg_count;
            Value result = native->function(*this, std::span<Value>(stack_.data() + args_begin, arg_count));
            stack_.resize(args_begin - 1);
            push(result);
            return;
        }

        throw RuntimeError("Can only call functions.");
    }

    void VM::call_closure(ClosureObject* closure, uint8_t arg_count) {
        FunctionObject* function = closure->function;
        if (arg_count != function->arity) {
            throw RuntimeError("Expected " + std::to_string(function->arity) +
                               " arguments but got " + std::to_string(arg_count) + ".");
        }
        if (call_frames_.size() >= config_.max_call_depth) {
            throw RuntimeError("Stack overflow.");
        }

        call_frames_.push_back(CallFrame{closure, 0, stack_.size() - arg_count - 1});
    }

    UpvalueObject* VM::capture_upvalue(size_t slot) {
        UpvalueObject* prev = nullptr;
        UpvalueObject* current = open_upvalues_;

        while (current && current->slot > slot) {
            prev = current;
            current = current->next_upvalue;
        }

        if (current && current->slot == slot) {
            return current;
        }

        auto* created = heap_.allocate<UpvalueObject>(slot);
        created->next_upvalue = current;
        if (!prev) {
            open_upvalues_ = created;
        } else {
            prev->next_upvalue = created;
        }
        return created;
    }

    void VM::close_upvalues(size_t last) {
        while (open_upvalues_ && open_upvalues_->slot >= last) {
            UpvalueObject* upvalue = open_upvalues_;
            upvalue->closed = stack_[upvalue->slot];
            upvalue->is_open = false;
            open_upvalues_ = upvalue->next_upvalue;
            upvalue->next_upvalue = nullptr;
        }
    }

    Value& VM::upvalue_ref(UpvalueObject* upvalue) {
        if (!upvalue->is_open) {
            return upvalue->closed;
        }
        if (upvalue->slot >= stack_.size()) {
            throw InternalError("open upvalue refers past the top of the stack");
        }
        return stack_[upvalue->slot];
    }

    uint32_t VM::current_line() const {
        if (call_frames_.empty()) {
            return 0;
        }
        const CallFrame& f = call_frames_.back();
        return f.closure->function->chunk->line_at(f.ip > 0 ? f.ip - 1 : 0);
    }

    std::vector<std::string> VM::build_stack_trace() const {
        std::vector<std::string> trace;
        std::string last;
        size_t repeats = 0;
        auto flush_repeats = [&]() {
            if (repeats > 0) {
                trace.push_back("[previous frame repeated " + std::to_string(repeats) + " more times]");
                repeats = 0;
            }
        };

        for (auto it = call_frames_.rbegin(); it != call_frames_.rend(); ++it) {
            const FunctionObject* function = it->closure->function;
            uint32_t line = function->chunk->line_at(it->ip > 0 ? it->ip - 1 : 0);
            std::string entry = "[line " + std::to_string(line) + "] in ";
            if (function->name.empty()) {
                entry += "script";
            } else {
                entry += function->name + "()";
            }
            // Runs of identical frames (deep recursion) collapse to one line.
            if (!trace.empty() && entry == last) {
                ++repeats;
                continue;
            }
            flush_repeats();
            last = entry;
            trace.push_back(std::move(entry));
        }
        flush_repeats();
        return trace;
    }

    void VM::reset_stack() {
        // Escaped closures keep their captured values after the frames go.
        close_upvalues(0);
        stack_.clear();
        call_frames_.clear();
        open_upvalues_ = nullptr;
    }

    void VM::mark_roots(Heap& heap) {
        for (const Value& value : stack_) {
            heap.mark_value(value);
        }
        for (const CallFrame& f : call_frames_) {
            heap.mark_object(f.closure);
        }
        for (UpvalueObject* upvalue = open_upvalues_; upvalue; upvalue = upvalue->next_upvalue) {
            heap.mark_object(upvalue);
        }
        for (const auto& [name, value] : globals_) {
            heap.mark_object(name);
            heap.mark_value(value);
        }
    }

    void VM::trace_instruction() const {
        std::cerr << "          ";
        for (const Value& value : stack_) {
            std::cerr << "[ " << value.to_string() << " ]";
        }
        std::cerr << '\n';
        const CallFrame& f = call_frames_.back();
        disassemble_instruction(*f.closure->function->chunk, f.ip, std::cerr);
    }

    void VM::print_stats(std::ostream& out) const {
        heap_.print_stats(out);
        out << "Stack size: " << stack_.size() << "\n";
        out << "Globals: " << globals_.size() << "\n";
    }

} // namespace loxvm
