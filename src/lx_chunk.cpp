// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_chunk.cpp
 * @brief Chunk construction and operand access.
 */

#include "loxvm/lx_chunk.hpp"

#include <bit>

namespace loxvm {

void Chunk::write(uint8_t byte, uint32_t line) {
    code.push_back(byte);
    lines.push_back(line);
}

void Chunk::write_op(OpCode op, uint32_t line) {
    write(static_cast<uint8_t>(op), line);
}

size_t Chunk::add_constant(Number value) {
    const auto bits = std::bit_cast<uint64_t>(value);
    for (size_t i = 0; i < constants.size(); ++i) {
        if (std::bit_cast<uint64_t>(constants[i].as_number()) == bits) {
            return i;
        }
    }
    constants.push_back(Value::from_number(value));
    return constants.size() - 1;
}

size_t Chunk::add_string(const std::string& str) {
    for (size_t i = 0; i < strings.size(); ++i) {
        if (strings[i] == str) {
            return i;
        }
    }
    strings.push_back(str);
    return strings.size() - 1;
}

size_t Chunk::add_function(FunctionPrototype proto) {
    functions.push_back(std::move(proto));
    return functions.size() - 1;
}

size_t Chunk::emit_jump(OpCode op, uint32_t line) {
    write_op(op, line);
    write(0xFF, line);
    write(0xFF, line);
    return code.size() - 2;
}

bool Chunk::patch_jump(size_t offset) {
    if (offset + 2 > code.size()) {
        throw InternalError("jump patch offset " + std::to_string(offset) + " is outside the chunk");
    }

    // Distance from the byte after the operand to the current end.
    size_t jump = code.size() - offset - 2;
    if (jump > 0xFFFF) {
        return false;
    }

    code[offset] = static_cast<uint8_t>((jump >> 8) & 0xFF);
    code[offset + 1] = static_cast<uint8_t>(jump & 0xFF);
    return true;
}

uint8_t Chunk::read_byte(size_t offset) const {
    if (offset >= code.size()) {
        throw InternalError("operand read past end of code at " + std::to_string(offset));
    }
    return code[offset];
}

uint16_t Chunk::read_short(size_t offset) const {
    if (offset + 1 >= code.size()) {
        throw InternalError("operand read past end of code at " + std::to_string(offset));
    }
    return static_cast<uint16_t>((code[offset] << 8) | code[offset + 1]);
}

uint32_t Chunk::line_at(size_t offset) const {
    if (lines.empty()) return 0;
    if (offset >= lines.size()) return lines.back();
    return lines[offset];
}

} // namespace loxvm
