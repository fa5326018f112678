// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_vm_opcodes.inl
 * @brief OpCodeHandler specializations, one per opcode.
 *
 * Included at the end of lx_vm.hpp. Every handler runs with the opcode
 * byte already consumed; it reads its own operands.
 */

#pragma once
#define OPCODE(T) template<> struct OpCodeHandler<T>
#define OP_BODY static void execute(VM& vm)

namespace loxvm {

    namespace detail {
        // Pops two numbers and pushes op(a, b); both operands must be numbers.
        template<typename Op>
        inline void binary_number_op(VM& vm, Op op) {
            Value b = vm.peek(0);
            Value a = vm.peek(1);
            if (!a.is_number() || !b.is_number()) {
                throw RuntimeError("Operands must be numbers.");
            }
            vm.pop();
            vm.pop();
            vm.push(op(a.as_number(), b.as_number()));
        }
    } // namespace detail

    // ============================================================================
    // Literals and constants
    // ============================================================================

    OPCODE(OpCode::OP_CONSTANT)
    {
        OP_BODY
        {
            vm.push(vm.read_constant());
        }
    };

    OPCODE(OpCode::OP_STRING)
    {
        OP_BODY
        {
            vm.push(Value::from_object(vm.read_string()));
        }
    };

    OPCODE(OpCode::OP_NIL)
    {
        OP_BODY
        {
            vm.push(Value::nil());
        }
    };

    OPCODE(OpCode::OP_TRUE)
    {
        OP_BODY
        {
            vm.push(Value::from_bool(true));
        }
    };

    OPCODE(OpCode::OP_FALSE)
    {
        OP_BODY
        {
            vm.push(Value::from_bool(false));
        }
    };

    OPCODE(OpCode::OP_POP)
    {
        OP_BODY
        {
            vm.pop();
        }
    };

    // ============================================================================
    // Arithmetic
    // ============================================================================

    OPCODE(OpCode::OP_ADD)
    {
        OP_BODY
        {
            Value b = vm.peek(0);
            Value a = vm.peek(1);
            if (a.is_number() && b.is_number()) {
                vm.pop();
                vm.pop();
                vm.push(Value::from_number(a.as_number() + b.as_number()));
            } else if (a.is_string() && b.is_string()) {
                const auto* lhs = static_cast<StringObject*>(a.as_object());
                const auto* rhs = static_cast<StringObject*>(b.as_object());
                std::string joined;
                joined.reserve(lhs->data.size() + rhs->data.size());
                joined += lhs->data;
                joined += rhs->data;
                StringObject* result = vm.intern(joined);
                vm.pop();
                vm.pop();
                vm.push(Value::from_object(result));
            } else {
                throw RuntimeError("Operands must be two numbers or two strings.");
            }
        }
    };

    OPCODE(OpCode::OP_SUBTRACT)
    {
        OP_BODY
        {
            detail::binary_number_op(vm, [](Number a, Number b) { return Value::from_number(a - b); });
        }
    };

    OPCODE(OpCode::OP_MULTIPLY)
    {
        OP_BODY
        {
            detail::binary_number_op(vm, [](Number a, Number b) { return Value::from_number(a * b); });
        }
    };

    // IEEE-754 division: x/0 yields an infinity or NaN.
    OPCODE(OpCode::OP_DIVIDE)
    {
        OP_BODY
        {
            detail::binary_number_op(vm, [](Number a, Number b) { return Value::from_number(a / b); });
        }
    };

    OPCODE(OpCode::OP_NEGATE)
    {
        OP_BODY
        {
            Value v = vm.peek(0);
            if (!v.is_number()) {
                throw RuntimeError("Operand must be a number.");
            }
            vm.pop();
            vm.push(Value::from_number(-v.as_number()));
        }
    };

    OPCODE(OpCode::OP_NOT)
    {
        OP_BODY
        {
            Value v = vm.pop();
            vm.push(Value::from_bool(v.is_falsey()));
        }
    };

    // ============================================================================
    // Comparison
    // ============================================================================

    OPCODE(OpCode::OP_EQUAL)
    {
        OP_BODY
        {
            Value b = vm.pop();
            Value a = vm.pop();
            vm.push(Value::from_bool(a.equals(b)));
        }
    };

    OPCODE(OpCode::OP_NOT_EQUAL)
    {
        OP_BODY
        {
            Value b = vm.pop();
            Value a = vm.pop();
            vm.push(Value::from_bool(!a.equals(b)));
        }
    };

    OPCODE(OpCode::OP_LESS)
    {
        OP_BODY
        {
            detail::binary_number_op(vm, [](Number a, Number b) { return Value::from_bool(a < b); });
        }
    };

    OPCODE(OpCode::OP_GREATER)
    {
        OP_BODY
        {
            detail::binary_number_op(vm, [](Number a, Number b) { return Value::from_bool(a > b); });
        }
    };

    OPCODE(OpCode::OP_LESS_EQUAL)
    {
        OP_BODY
        {
            detail::binary_number_op(vm, [](Number a, Number b) { return Value::from_bool(a <= b); });
        }
    };

    OPCODE(OpCode::OP_GREATER_EQUAL)
    {
        OP_BODY
        {
            detail::binary_number_op(vm, [](Number a, Number b) { return Value::from_bool(a >= b); });
        }
    };

    OPCODE(OpCode::OP_TYPEOF)
    {
        OP_BODY
        {
            Value v = vm.pop();
            vm.push(Value::from_object(vm.intern(v.type_name())));
        }
    };

    // ============================================================================
    // Variables
    // ============================================================================

    OPCODE(OpCode::OP_DEFINE_GLOBAL)
    {
        OP_BODY
        {
            StringObject* name = vm.read_string();
            vm.globals_[name] = vm.peek(0);
            vm.pop();
        }
    };

    OPCODE(OpCode::OP_GET_GLOBAL)
    {
        OP_BODY
        {
            StringObject* name = vm.read_string();
            auto it = vm.globals_.find(name);
            if (it == vm.globals_.end()) {
                throw RuntimeError("Undefined variable '" + name->data + "'.");
            }
            vm.push(it->second);
        }
    };

    OPCODE(OpCode::OP_SET_GLOBAL)
    {
        OP_BODY
        {
            StringObject* name = vm.read_string();
            auto it = vm.globals_.find(name);
            if (it == vm.globals_.end()) {
                throw RuntimeError("Undefined variable '" + name->data + "'.");
            }
            it->second = vm.peek(0);
        }
    };

    OPCODE(OpCode::OP_GET_LOCAL)
    {
        OP_BODY
        {
            uint16_t slot = vm.read_short();
            size_t base = vm.current_stack_base();
            if (base + slot >= vm.stack_.size()) {
                throw InternalError("local slot out of range");
            }
            vm.push(vm.stack_[base + slot]);
        }
    };

    OPCODE(OpCode::OP_SET_LOCAL)
    {
        OP_BODY
        {
            uint16_t slot = vm.read_short();
            size_t base = vm.current_stack_base();
            if (base + slot >= vm.stack_.size()) {
                throw InternalError("local slot out of range");
            }
            vm.stack_[base + slot] = vm.peek(0);
        }
    };

    OPCODE(OpCode::OP_GET_UPVALUE)
    {
        OP_BODY
        {
            uint16_t slot = vm.read_short();
            auto* closure = vm.frame().closure;
            if (slot >= closure->upvalues.size()) {
                throw InternalError("upvalue index out of range");
            }
            vm.push(vm.upvalue_ref(closure->upvalues[slot]));
        }
    };

    OPCODE(OpCode::OP_SET_UPVALUE)
    {
        OP_BODY
        {
            uint16_t slot = vm.read_short();
            auto* closure = vm.frame().closure;
            if (slot >= closure->upvalues.size()) {
                throw InternalError("upvalue index out of range");
            }
            vm.upvalue_ref(closure->upvalues[slot]) = vm.peek(0);
        }
    };

    OPCODE(OpCode::OP_CLOSE_UPVALUE)
    {
        OP_BODY
        {
            if (vm.stack_.empty()) {
                throw InternalError("close upvalue on empty stack");
            }
            vm.close_upvalues(vm.stack_.size() - 1);
            vm.pop();
        }
    };

    // ============================================================================
    // Control Flow
    // ============================================================================

    OPCODE(OpCode::OP_JUMP)
    {
        OP_BODY
        {
            uint16_t offset = vm.read_short();
            vm.frame().ip += offset;
        }
    };

    OPCODE(OpCode::OP_JUMP_IF_FALSE)
    {
        OP_BODY
        {
            uint16_t offset = vm.read_short();
            if (vm.peek(0).is_falsey()) {
                vm.frame().ip += offset;
            }
        }
    };

    OPCODE(OpCode::OP_LOOP)
    {
        OP_BODY
        {
            uint16_t offset = vm.read_short();
            if (offset > vm.frame().ip) {
                throw InternalError("loop target before start of code");
            }
            vm.frame().ip -= offset;
        }
    };

    // ============================================================================
    // Functions
    // ============================================================================

    OPCODE(OpCode::OP_CALL)
    {
        OP_BODY
        {
            uint8_t arg_count = vm.read_byte();
            if (vm.stack_.size() < static_cast<size_t>(arg_count) + 1) {
                throw InternalError("not enough values for function call");
            }
            vm.call_value(vm.peek(arg_count), arg_count);
        }
    };

    OPCODE(OpCode::OP_CLOSURE)
    {
        OP_BODY
        {
            uint16_t index = vm.read_short();
            const Chunk& chunk = vm.current_chunk();
            if (index >= chunk.functions.size()) {
                throw InternalError("function index out of range");
            }

            const FunctionPrototype& proto = chunk.functions[index];
            auto* func = vm.heap_.allocate<FunctionObject>(
                proto.name, proto.arity, proto.upvalues.size(), proto.chunk);
            auto* closure = vm.heap_.allocate<ClosureObject>(func);

            ClosureObject* enclosing = vm.frame().closure;
            size_t base = vm.current_stack_base();

            for (size_t i = 0; i < proto.upvalues.size(); ++i) {
                const auto& uv = proto.upvalues[i];
                if (uv.is_local) {
                    closure->upvalues[i] = vm.capture_upvalue(base + uv.index);
                } else {
                    if (uv.index >= enclosing->upvalues.size()) {
                        throw InternalError("enclosing upvalue index out of range");
                    }
                    closure->upvalues[i] = enclosing->upvalues[uv.index];
                }
            }

            vm.push(Value::from_object(closure));
        }
    };

    OPCODE(OpCode::OP_RETURN)
    {
        OP_BODY
        {
            Value result = vm.pop();
            CallFrame finished = vm.frame();

            vm.close_upvalues(finished.stack_base);
            vm.call_frames_.pop_back();
            vm.stack_.resize(finished.stack_base);

            // Returning from the script frame ends execution.
            if (!vm.call_frames_.empty()) {
                vm.push(result);
            }
        }
    };

    // ============================================================================
    // I/O
    // ============================================================================

    OPCODE(OpCode::OP_PRINT)
    {
        OP_BODY
        {
            Value v = vm.pop();
            vm.output() << v.to_string() << '\n';
        }
    };

    constexpr std::array<OpHandlerFunc, 256> make_handler_table()
    {
        std::array<OpHandlerFunc, 256> tbl{};
        tbl.fill(nullptr);

#define X(op) tbl[static_cast<uint8_t>(OpCode::op)] = &OpCodeHandler<OpCode::op>::execute;
#include "lx_opcodes.def"
#undef X

        return tbl;
    }
}

#undef OPCODE
#undef OP_BODY
