// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_heap.hpp
 * @brief Object heap with string interning and mark-sweep collection.
 *
 * The Heap owns every Object through an intrusive list. Reachability is
 * traced from roots supplied by a GcRootSource (the VM). Collection is
 * never triggered by allocation itself; the VM asks for it at instruction
 * boundaries through collect_if_needed().
 */

#pragma once

#include "lx_core.hpp"
#include "lx_value.hpp"

#include <iosfwd>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace loxvm {

// Implemented by whoever holds references into the heap.
class GcRootSource {
public:
    virtual ~GcRootSource() = default;
    virtual void mark_roots(Heap& heap) = 0;
};

struct HeapConfig {
    size_t initial_threshold = 1024 * 1024;
    size_t growth_factor = 2;
    bool stress = false;
};

class Heap {
public:
    explicit Heap(HeapConfig config = HeapConfig{});
    ~Heap();

    // Prevent copying
    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;

    template<typename T, typename... Args>
    T* allocate(Args&&... args);

    // Returns the unique string object with this content.
    StringObject* intern(std::string_view text);

    void set_root_source(GcRootSource* roots) { roots_ = roots; }

    // Safe-point hook: collects when the threshold is crossed (or always
    // in stress mode). Returns true if a collection ran.
    bool collect_if_needed();
    void collect();

    // Marking interface used by roots and Object::trace
    void mark_object(Object* obj);
    void mark_value(const Value& value);

    size_t bytes_allocated() const { return bytes_allocated_; }
    size_t next_gc() const { return next_gc_; }
    size_t object_count() const { return stats_.current_objects; }
    const MemoryStats& stats() const { return stats_; }
    void print_stats(std::ostream& out) const;

private:
    HeapConfig config_;
    Object* objects_{nullptr};
    size_t bytes_allocated_{0};
    size_t next_gc_;
    std::vector<Object*> gray_stack_;
    GcRootSource* roots_{nullptr};
    bool is_collecting_{false};

    // Weak: entries for unmarked strings are dropped before the sweep.
    std::unordered_map<std::string_view, StringObject*> strings_;

    MemoryStats stats_;

    void link(Object* obj);
    void trace_references();
    void remove_white_strings();
    void sweep();
    void free_object(Object* obj);
};

template<typename T, typename... Args>
T* Heap::allocate(Args&&... args) {
    T* obj = new T(std::forward<Args>(args)...);
    link(obj);
    return obj;
}

} // namespace loxvm
