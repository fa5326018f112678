// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_value.hpp
 * @brief Runtime value representation and heap object types.
 *
 * Value is a 16-byte tagged union: nil, bool and number are stored
 * inline, everything else is a pointer to an Object owned by the Heap.
 */

#pragma once

#include "lx_core.hpp"

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace loxvm {

using Number = double;
using Bool = bool;

struct Chunk;

// Lox value: nil, bool, number or a heap object reference.
class Value {
public:
    enum class Type : uint8_t {
        Nil,
        Bool,
        Number,
        Object
    };

private:
    Type type_{Type::Nil};
    uint8_t padding_[7]{};

    union {
        Bool bool_val;
        Number number_val;
        Object* object_val;
    } data_{.number_val = 0};

public:
    Value() : type_(Type::Nil) {}

    static Value nil() { return Value(); }

    static Value from_bool(Bool b) {
        Value v;
        v.type_ = Type::Bool;
        v.data_.object_val = nullptr;
        v.data_.bool_val = b;
        return v;
    }

    static Value from_number(Number n) {
        Value v;
        v.type_ = Type::Number;
        v.data_.number_val = n;
        return v;
    }

    static Value from_object(Object* obj) {
        Value v;
        v.type_ = Type::Object;
        v.data_.object_val = obj;
        return v;
    }

    bool is_nil() const { return type_ == Type::Nil; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_object() const { return type_ == Type::Object; }
    bool is_object_type(ObjectType t) const {
        return is_object() && data_.object_val && data_.object_val->type == t;
    }
    bool is_string() const { return is_object_type(ObjectType::String); }

    // Unchecked access; the tag must match (asserted in debug builds).
    Bool as_bool() const {
        LX_ASSERT(is_bool(), "Value is not a bool");
        return data_.bool_val;
    }

    Number as_number() const {
        LX_ASSERT(is_number(), "Value is not a number");
        return data_.number_val;
    }

    Object* as_object() const {
        LX_ASSERT(is_object(), "Value is not an object");
        return data_.object_val;
    }

    // nil and false are falsy, everything else is truthy
    bool is_falsey() const;

    // Printed form used by `print`
    std::string to_string() const;

    // Name reported by `typeof`
    const char* type_name() const;

    // Same type and same value. Numbers use IEEE comparison, objects
    // (including interned strings) compare by identity.
    bool equals(const Value& other) const;
};

// Formats a number the way `print` shows it: integral values without a
// fraction, everything else in the shortest round-trip decimal form.
std::string format_number(Number n);

// Specific object types
class StringObject : public Object {
public:
    std::string data;

    explicit StringObject(std::string s)
        : Object(ObjectType::String), data(std::move(s)) {}

    std::string to_string() const override { return data; }
    size_t memory_size() const override {
        return sizeof(StringObject) + data.capacity();
    }
};

class FunctionObject : public Object {
public:
    std::string name;  // empty for the top-level script
    int arity{0};
    size_t upvalue_count{0};
    std::shared_ptr<const Chunk> chunk;

    FunctionObject(std::string function_name,
                   int function_arity,
                   size_t function_upvalue_count,
                   std::shared_ptr<const Chunk> function_chunk);

    std::string to_string() const override;
    size_t memory_size() const override;
};

// Upvalue for captured variables in closures. While open it refers to a
// slot of the VM stack by index, so stack growth never invalidates it.
class UpvalueObject : public Object {
public:
    size_t slot;                  // Stack slot while open
    Value closed;                 // Holds value after variable goes out of scope
    bool is_open{true};
    UpvalueObject* next_upvalue;  // Linked list of open upvalues

    explicit UpvalueObject(size_t stack_slot)
        : Object(ObjectType::Upvalue), slot(stack_slot), closed(Value::nil()), next_upvalue(nullptr) {}

    std::string to_string() const override {
        return "<upvalue>";
    }

    size_t memory_size() const override {
        return sizeof(UpvalueObject);
    }

    void trace(Heap& heap) const override;
};

// A function together with the variables it captured.
class ClosureObject : public Object {
public:
    FunctionObject* function;
    std::vector<UpvalueObject*> upvalues;

    explicit ClosureObject(FunctionObject* fn)
        : Object(ObjectType::Closure), function(fn),
          upvalues(fn ? fn->upvalue_count : 0, nullptr) {}

    std::string to_string() const override {
        return function ? function->to_string() : "<closure>";
    }

    size_t memory_size() const override {
        return sizeof(ClosureObject) + upvalues.capacity() * sizeof(UpvalueObject*);
    }

    void trace(Heap& heap) const override;
};

// Host function signature: receives the VM and the call arguments.
using NativeFn = std::function<Value(VM&, std::span<Value>)>;

class NativeFunctionObject : public Object {
public:
    std::string name;
    int arity;
    NativeFn function;

    NativeFunctionObject(std::string native_name, int native_arity, NativeFn fn)
        : Object(ObjectType::Native), name(std::move(native_name)),
          arity(native_arity), function(std::move(fn)) {}

    std::string to_string() const override {
        return "<fun (native) " + name + ">";
    }

    size_t memory_size() const override {
        return sizeof(NativeFunctionObject) + name.capacity();
    }
};

// Verify size constraint
static_assert(sizeof(Value) == 16, "Value is expected to stay two words wide");

} // namespace loxvm
