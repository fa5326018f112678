// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_disassembler.cpp
 * @brief Bytecode listing.
 */

#include "loxvm/lx_disassembler.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace loxvm {

namespace {

void write_name(std::ostream& out, const char* name) {
    out << std::setw(16) << std::left << std::setfill(' ') << name << std::right;
}

size_t simple_instruction(const char* name, size_t offset, std::ostream& out) {
    out << name << "\n";
    return offset + 1;
}

size_t constant_instruction(const char* name, const Chunk& chunk, size_t offset, std::ostream& out) {
    uint16_t constant = chunk.read_short(offset + 1);
    write_name(out, name);
    out << " " << std::setw(4) << constant << " '";
    if (constant < chunk.constants.size()) {
        out << chunk.constants[constant].to_string();
    } else {
        out << "<invalid>";
    }
    out << "'\n";
    return offset + 3;
}

size_t string_instruction(const char* name, const Chunk& chunk, size_t offset, std::ostream& out) {
    uint16_t index = chunk.read_short(offset + 1);
    write_name(out, name);
    out << " " << std::setw(4) << index << " '";
    if (index < chunk.strings.size()) {
        out << chunk.strings[index];
    } else {
        out << "<invalid>";
    }
    out << "'\n";
    return offset + 3;
}

size_t short_instruction(const char* name, const Chunk& chunk, size_t offset, std::ostream& out) {
    uint16_t value = chunk.read_short(offset + 1);
    write_name(out, name);
    out << " " << std::setw(4) << value << "\n";
    return offset + 3;
}

size_t byte_instruction(const char* name, const Chunk& chunk, size_t offset, std::ostream& out) {
    uint8_t value = chunk.read_byte(offset + 1);
    write_name(out, name);
    out << " " << std::setw(4) << static_cast<int>(value) << "\n";
    return offset + 2;
}

size_t jump_instruction(const char* name, int sign, const Chunk& chunk, size_t offset, std::ostream& out) {
    uint16_t jump = chunk.read_short(offset + 1);
    long long target = static_cast<long long>(offset) + 3 + sign * static_cast<long long>(jump);
    write_name(out, name);
    out << " " << std::setw(4) << offset << " -> " << target << "\n";
    return offset + 3;
}

size_t closure_instruction(const char* name, const Chunk& chunk, size_t offset, std::ostream& out) {
    uint16_t index = chunk.read_short(offset + 1);
    write_name(out, name);
    out << " " << std::setw(4) << index << " ";
    if (index >= chunk.functions.size()) {
        out << "<invalid>\n";
        return offset + 3;
    }

    const FunctionPrototype& proto = chunk.functions[index];
    out << "<fun " << proto.name << ">\n";
    for (const UpvalueInfo& uv : proto.upvalues) {
        out << "   |                     "
            << (uv.is_local ? "local " : "upvalue ") << uv.index << "\n";
    }
    return offset + 3;
}

} // namespace

void disassemble_chunk(const Chunk& chunk, const std::string& name, std::ostream& out) {
    out << "== " << name << " ==\n";
    for (size_t offset = 0; offset < chunk.code.size();) {
        offset = disassemble_instruction(chunk, offset, out);
    }

    for (const FunctionPrototype& proto : chunk.functions) {
        if (proto.chunk) {
            disassemble_chunk(*proto.chunk, "<fun " + proto.name + ">", out);
        }
    }
}

std::string disassemble_chunk(const Chunk& chunk, const std::string& name) {
    std::ostringstream out;
    disassemble_chunk(chunk, name, out);
    return out.str();
}

size_t disassemble_instruction(const Chunk& chunk, size_t offset, std::ostream& out) {
    out << std::setw(4) << std::setfill('0') << offset << " " << std::setfill(' ');

    if (offset > 0 && offset < chunk.lines.size() && chunk.lines[offset] == chunk.lines[offset - 1]) {
        out << "   | ";
    } else {
        out << std::setw(4) << chunk.line_at(offset) << " ";
    }

    uint8_t byte = chunk.read_byte(offset);
    if (!is_valid_opcode(byte)) {
        out << "Unknown opcode " << static_cast<int>(byte) << "\n";
        return offset + 1;
    }

    OpCode instruction = static_cast<OpCode>(byte);
    const char* name = opcode_name(instruction);

    switch (instruction) {
        case OpCode::OP_CONSTANT:
            return constant_instruction(name, chunk, offset, out);
        case OpCode::OP_STRING:
        case OpCode::OP_DEFINE_GLOBAL:
        case OpCode::OP_GET_GLOBAL:
        case OpCode::OP_SET_GLOBAL:
            return string_instruction(name, chunk, offset, out);
        case OpCode::OP_GET_LOCAL:
        case OpCode::OP_SET_LOCAL:
        case OpCode::OP_GET_UPVALUE:
        case OpCode::OP_SET_UPVALUE:
            return short_instruction(name, chunk, offset, out);
        case OpCode::OP_JUMP:
        case OpCode::OP_JUMP_IF_FALSE:
            return jump_instruction(name, 1, chunk, offset, out);
        case OpCode::OP_LOOP:
            return jump_instruction(name, -1, chunk, offset, out);
        case OpCode::OP_CALL:
            return byte_instruction(name, chunk, offset, out);
        case OpCode::OP_CLOSURE:
            return closure_instruction(name, chunk, offset, out);
        case OpCode::OP_NIL:
        case OpCode::OP_TRUE:
        case OpCode::OP_FALSE:
        case OpCode::OP_POP:
        case OpCode::OP_ADD:
        case OpCode::OP_SUBTRACT:
        case OpCode::OP_MULTIPLY:
        case OpCode::OP_DIVIDE:
        case OpCode::OP_NEGATE:
        case OpCode::OP_NOT:
        case OpCode::OP_EQUAL:
        case OpCode::OP_NOT_EQUAL:
        case OpCode::OP_LESS:
        case OpCode::OP_GREATER:
        case OpCode::OP_LESS_EQUAL:
        case OpCode::OP_GREATER_EQUAL:
        case OpCode::OP_TYPEOF:
        case OpCode::OP_CLOSE_UPVALUE:
        case OpCode::OP_RETURN:
        case OpCode::OP_PRINT:
            return simple_instruction(name, offset, out);
    }

    out << "Unknown opcode " << static_cast<int>(byte) << "\n";
    return offset + 1;
}

} // namespace loxvm
