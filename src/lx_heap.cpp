// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lx_heap.cpp
 * @brief Heap allocation bookkeeping, interning and mark-sweep GC.
 */

#include "loxvm/lx_heap.hpp"

#include <algorithm>
#include <iostream>

namespace loxvm {

Heap::Heap(HeapConfig config)
    : config_(config), next_gc_(config.initial_threshold) {
    if (config_.growth_factor == 0) {
        config_.growth_factor = 1;
    }
}

Heap::~Heap() {
    Object* obj = objects_;
    while (obj) {
        Object* next = obj->next;
        free_object(obj);
        obj = next;
    }
    objects_ = nullptr;
    strings_.clear();
}

void Heap::link(Object* obj) {
    obj->next = objects_;
    objects_ = obj;

    obj->tracked_size = obj->memory_size();
    bytes_allocated_ += obj->tracked_size;
    stats_.total_allocated += obj->tracked_size;
    stats_.current_objects++;
    if (stats_.current_objects > stats_.peak_objects) {
        stats_.peak_objects = stats_.current_objects;
    }

    LX_DEBUG_GC("ALLOCATE %p [%s] size: %zu bytes",
        static_cast<void*>(obj), object_type_name(obj->type), obj->tracked_size);
}

StringObject* Heap::intern(std::string_view text) {
    auto it = strings_.find(text);
    if (it != strings_.end()) {
        return it->second;
    }

    auto* str = allocate<StringObject>(std::string(text));
    // Key views the object's own buffer, which never changes after creation.
    strings_.emplace(std::string_view(str->data), str);
    stats_.interned_strings = strings_.size();
    return str;
}

bool Heap::collect_if_needed() {
    if (config_.stress || bytes_allocated_ > next_gc_) {
        collect();
        return true;
    }
    return false;
}

void Heap::collect() {
    if (is_collecting_) {
        return;
    }
    is_collecting_ = true;

    LX_DEBUG_GC("-- begin collection (%zu bytes, %zu objects)",
        bytes_allocated_, stats_.current_objects);
    const size_t before = bytes_allocated_;

    if (roots_) {
        roots_->mark_roots(*this);
    }
    trace_references();
    remove_white_strings();
    sweep();

    next_gc_ = std::max(config_.initial_threshold, bytes_allocated_ * config_.growth_factor);
    stats_.collections++;
    is_collecting_ = false;

    LX_DEBUG_GC("-- end collection: freed %zu bytes, next at %zu",
        before - bytes_allocated_, next_gc_);
    (void)before;
}

void Heap::mark_object(Object* obj) {
    if (obj == nullptr || obj->is_marked) {
        return;
    }
    LX_DEBUG_GC("MARK %p [%s]", static_cast<void*>(obj), object_type_name(obj->type));
    obj->is_marked = true;
    gray_stack_.push_back(obj);
}

void Heap::mark_value(const Value& value) {
    if (value.is_object()) {
        mark_object(value.as_object());
    }
}

void Heap::trace_references() {
    while (!gray_stack_.empty()) {
        Object* obj = gray_stack_.back();
        gray_stack_.pop_back();
        obj->trace(*this);
    }
}

void Heap::remove_white_strings() {
    for (auto it = strings_.begin(); it != strings_.end();) {
        if (!it->second->is_marked) {
            it = strings_.erase(it);
        } else {
            ++it;
        }
    }
    stats_.interned_strings = strings_.size();
}

void Heap::sweep() {
    Object** curr = &objects_;
    while (*curr) {
        Object* obj = *curr;
        if (obj->is_marked) {
            obj->is_marked = false;
            curr = &obj->next;
        } else {
            *curr = obj->next;
            free_object(obj);
        }
    }
}

void Heap::free_object(Object* obj) {
    LX_DEBUG_GC("FREE %p [%s] size: %zu bytes",
        static_cast<void*>(obj), object_type_name(obj->type), obj->tracked_size);

    bytes_allocated_ -= std::min(bytes_allocated_, obj->tracked_size);
    stats_.total_freed += obj->tracked_size;
    if (stats_.current_objects > 0) {
        stats_.current_objects--;
    }
    delete obj;
}

void Heap::print_stats(std::ostream& out) const {
    out << "\n=== Memory Statistics ===\n";
    out << "Total allocated: " << stats_.total_allocated << " bytes\n";
    out << "Total freed: " << stats_.total_freed << " bytes\n";
    out << "Current objects: " << stats_.current_objects << "\n";
    out << "Peak objects: " << stats_.peak_objects << "\n";
    out << "Live bytes: " << bytes_allocated_ << "\n";
    out << "Collections: " << stats_.collections << "\n";
    out << "Interned strings: " << stats_.interned_strings << "\n";
    out << "Next collection at: " << next_gc_ << " bytes\n";
    out << "========================\n";
}

} // namespace loxvm
