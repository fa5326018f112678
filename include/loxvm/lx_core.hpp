// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_core.hpp
 * @brief Core object definitions shared by the heap, values and VM.
 *
 * Declares the heap object base class, object type tags, memory
 * statistics and the debug tracing macros.
 */

#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace loxvm {

// Forward declarations
class VM;
class Heap;
class Object;
class Value;

enum class ObjectType : uint8_t {
    String,
    Function,
    Closure,
    Upvalue,
    Native
};

// Debug name of an object kind
inline const char* object_type_name(ObjectType t) {
    switch (t) {
        case ObjectType::String:   return "String";
        case ObjectType::Function: return "Function";
        case ObjectType::Closure:  return "Closure";
        case ObjectType::Upvalue:  return "Upvalue";
        case ObjectType::Native:   return "Native";
    }
    return "Unknown";
}

// Common header of every heap object. Owned and freed by the Heap.
class Object {
public:
    ObjectType type;
    bool is_marked{false};
    Object* next{nullptr};  // Heap's intrusive object list
    size_t tracked_size{0};

    explicit Object(ObjectType t) : type(t) {}
    virtual ~Object() = default;

    virtual std::string to_string() const = 0;
    virtual size_t memory_size() const = 0;

    // Mark every object this object keeps alive.
    virtual void trace(Heap& heap) const { (void)heap; }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;
};

// Counters reported by --stats
struct MemoryStats {
    size_t total_allocated{0};
    size_t total_freed{0};
    size_t current_objects{0};
    size_t peak_objects{0};
    size_t collections{0};
    size_t interned_strings{0};
};

// Raised for compiler/VM bugs (corrupt bytecode, bad jump patch, broken frame
// bookkeeping). Never caught by the VM.
class InternalError : public std::logic_error {
public:
    explicit InternalError(const std::string& msg)
        : std::logic_error("internal error: " + msg) {}
};

// Debug utilities
#ifdef LX_DEBUG
    #define LX_DEBUG_GC(fmt, ...) \
        std::fprintf(stderr, "[GC] " fmt "\n", ##__VA_ARGS__)
#else
    #define LX_DEBUG_GC(fmt, ...)
#endif

#define LX_ASSERT(cond, msg) assert((cond) && (msg))

} // namespace loxvm
