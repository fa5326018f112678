// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_chunk.hpp
 * @brief Bytecode container (Chunk) and function prototypes.
 *
 * A Chunk owns the instruction bytes of one function, a parallel line
 * table, the number constant pool, the string/identifier table and the
 * prototypes of the functions declared directly inside it. Chunks are
 * built by the compiler and shared read-only afterwards.
 */

#pragma once

#include "lx_value.hpp"
#include "lx_opcodes.hpp"

#include <memory>
#include <string>
#include <vector>

namespace loxvm {

// How a closure obtains one captured variable when it is created
struct UpvalueInfo {
    uint16_t index;    // Slot in the enclosing frame, or enclosing upvalue index
    bool is_local;
};

struct Chunk;

// Heap-independent description of a compiled function. OP_CLOSURE turns
// it into a FunctionObject and ClosureObject at run time.
struct FunctionPrototype {
    std::string name;
    int arity{0};
    std::vector<UpvalueInfo> upvalues;
    std::shared_ptr<const Chunk> chunk;
};

struct Chunk {
    std::vector<uint8_t> code;
    std::vector<uint32_t> lines;
    std::vector<Value> constants;
    std::vector<std::string> strings;
    std::vector<FunctionPrototype> functions;

    void write(uint8_t byte, uint32_t line);
    void write_op(OpCode op, uint32_t line);

    // Pool insertion. Numbers are deduplicated by bit pattern, strings by
    // content. Callers check the returned index against the operand width.
    size_t add_constant(Number value);
    size_t add_string(const std::string& str);
    size_t add_function(FunctionPrototype proto);

    // Writes op followed by a 0xFFFF placeholder, returns the operand offset.
    size_t emit_jump(OpCode op, uint32_t line);

    // Points the jump operand at `offset` to the current end of code.
    // Returns false when the distance does not fit in 16 bits.
    bool patch_jump(size_t offset);

    uint8_t read_byte(size_t offset) const;
    uint16_t read_short(size_t offset) const;

    size_t code_size() const { return code.size(); }
    uint32_t line_at(size_t offset) const;
};

} // namespace loxvm
