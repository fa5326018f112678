// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_value.cpp
 * @brief Value printing, equality and object tracing.
 */

#include "loxvm/lx_value.hpp"
#include "loxvm/lx_chunk.hpp"
#include "loxvm/lx_heap.hpp"

#include <charconv>
#include <cmath>

namespace loxvm {

std::string format_number(Number n) {
    if (std::isnan(n)) {
        return "NaN";
    }
    if (std::isinf(n)) {
        return n < 0 ? "-inf" : "inf";
    }

    // Fixed notation never needs more than ~330 characters for a double.
    char buffer[512];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), n, std::chars_format::fixed);
    if (result.ec != std::errc{}) {
        throw InternalError("number formatting failed");
    }
    return std::string(buffer, result.ptr);
}

bool Value::is_falsey() const {
    switch (type_) {
        case Type::Nil:
            return true;
        case Type::Bool:
            return !data_.bool_val;
        case Type::Number:
        case Type::Object:
            return false;
    }
    return false;
}

std::string Value::to_string() const {
    switch (type_) {
        case Type::Nil:
            return "nil";
        case Type::Bool:
            return data_.bool_val ? "true" : "false";
        case Type::Number:
            return format_number(data_.number_val);
        case Type::Object:
            if (data_.object_val) {
                return data_.object_val->to_string();
            }
            return "nil";
    }
    return "unknown";
}

const char* Value::type_name() const {
    switch (type_) {
        case Type::Nil:
            return "nil";
        case Type::Bool:
            return "boolean";
        case Type::Number:
            return "number";
        case Type::Object:
            switch (data_.object_val->type) {
                case ObjectType::String:
                    return "string";
                case ObjectType::Function:
                case ObjectType::Closure:
                case ObjectType::Native:
                    return "function";
                case ObjectType::Upvalue:
                    return "upvalue";
            }
            break;
    }
    return "unknown";
}

bool Value::equals(const Value& other) const {
    if (type_ != other.type_) {
        return false;
    }

    switch (type_) {
        case Type::Nil:
            return true;
        case Type::Bool:
            return data_.bool_val == other.data_.bool_val;
        case Type::Number:
            return data_.number_val == other.data_.number_val;
        case Type::Object:
            return data_.object_val == other.data_.object_val;
    }
    return false;
}

FunctionObject::FunctionObject(std::string function_name,
                               int function_arity,
                               size_t function_upvalue_count,
                               std::shared_ptr<const Chunk> function_chunk)
: Object(ObjectType::Function),
  name(std::move(function_name)),
  arity(function_arity),
  upvalue_count(function_upvalue_count),
  chunk(std::move(function_chunk)) {}

std::string FunctionObject::to_string() const {
    if (name.empty()) {
        return "<script>";
    }
    return "<fun " + name + ">";
}

size_t FunctionObject::memory_size() const {
    size_t total = sizeof(FunctionObject);
    total += name.capacity();
    return total;
}

void UpvalueObject::trace(Heap& heap) const {
    heap.mark_value(closed);
}

void ClosureObject::trace(Heap& heap) const {
    heap.mark_object(function);
    for (UpvalueObject* upvalue : upvalues) {
        heap.mark_object(upvalue);
    }
}

} // namespace loxvm
