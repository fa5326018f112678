// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_opcodes.hpp
 * @brief Opcode enumeration and name lookup.
 *
 * Defines OpCode enum using X-macro from lx_opcodes.def.
 * Provides opcode_name() for disassembly and tracing.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace loxvm {

    // Opcodes
    enum class OpCode : uint8_t {
#define X(name) name,
#include "lx_opcodes.def"
#undef X
    };

    inline constexpr size_t kOpCodeCount = 0
#define X(name) + 1
#include "lx_opcodes.def"
#undef X
        ;

    static_assert(kOpCodeCount <= 256, "opcode must fit in one byte");

    inline const char* opcode_name(OpCode op) {
        switch (op) {
#define X(name) case OpCode::name: return #name;
#include "lx_opcodes.def"
#undef X
        }
        return "OP_UNKNOWN";
    }

    inline bool is_valid_opcode(uint8_t byte) {
        return byte < kOpCodeCount;
    }
} // namespace loxvm
