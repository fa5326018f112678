// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_disassembler.hpp
 * @brief Human-readable listing of compiled bytecode.
 *
 * Read-only: nothing here mutates a Chunk, and the same chunk always
 * renders to the same text.
 */

#pragma once

#include "lx_chunk.hpp"

#include <iosfwd>
#include <string>

namespace loxvm {

// Lists every instruction of `chunk` under a "== name ==" header, followed
// by the listings of its nested functions.
std::string disassemble_chunk(const Chunk& chunk, const std::string& name);
void disassemble_chunk(const Chunk& chunk, const std::string& name, std::ostream& out);

// Writes one instruction and returns the offset of the next one.
size_t disassemble_instruction(const Chunk& chunk, size_t offset, std::ostream& out);

} // namespace loxvm
