// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file test_gc.cpp
 * @brief Heap bookkeeping, string interning and mark-sweep collection.
 */

#include <gtest/gtest.h>

#include "loxvm/lx_heap.hpp"
#include "test_helpers.hpp"

#include <vector>

using namespace loxvm;
using namespace loxvm::test;

namespace {

class FixedRoots : public GcRootSource {
public:
    std::vector<Object*> objects;

    void mark_roots(Heap& heap) override {
        for (Object* obj : objects) {
            heap.mark_object(obj);
        }
    }
};

} // namespace

// ============================================================================
// Heap
// ============================================================================

TEST(HeapTests, InterningReturnsSameObject) {
    Heap heap;
    StringObject* a = heap.intern("hello");
    StringObject* b = heap.intern(std::string("hel") + "lo");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, heap.intern("world"));
    EXPECT_EQ(heap.stats().interned_strings, 2u);
}

TEST(HeapTests, CollectWithoutRootsFreesEverything) {
    Heap heap;
    heap.intern("a");
    heap.intern("b");
    heap.allocate<UpvalueObject>(size_t{0});
    EXPECT_EQ(heap.object_count(), 3u);
    EXPECT_GT(heap.bytes_allocated(), 0u);

    heap.collect();
    EXPECT_EQ(heap.object_count(), 0u);
    EXPECT_EQ(heap.bytes_allocated(), 0u);
    EXPECT_EQ(heap.stats().interned_strings, 0u);
    EXPECT_EQ(heap.stats().collections, 1u);
}

TEST(HeapTests, RootedObjectsSurvive) {
    Heap heap;
    FixedRoots roots;
    heap.set_root_source(&roots);

    StringObject* kept = heap.intern("kept");
    heap.intern("dropped");
    roots.objects.push_back(kept);

    heap.collect();
    EXPECT_EQ(heap.object_count(), 1u);
    EXPECT_EQ(heap.intern("kept"), kept);
    EXPECT_FALSE(kept->is_marked);
}

TEST(HeapTests, TracingFollowsReferences) {
    Heap heap;
    FixedRoots roots;
    heap.set_root_source(&roots);

    auto* upvalue = heap.allocate<UpvalueObject>(size_t{0});
    upvalue->is_open = false;
    upvalue->closed = Value::from_object(heap.intern("captured"));
    roots.objects.push_back(upvalue);

    heap.collect();
    EXPECT_EQ(heap.object_count(), 2u);
}

TEST(HeapTests, ThresholdGatesCollection) {
    HeapConfig config;
    config.initial_threshold = 1024;
    Heap heap(config);

    heap.intern("small");
    EXPECT_FALSE(heap.collect_if_needed());

    for (int i = 0; i < 200; ++i) {
        heap.intern("string number " + std::to_string(i));
    }
    ASSERT_GT(heap.bytes_allocated(), config.initial_threshold);
    EXPECT_TRUE(heap.collect_if_needed());
    EXPECT_EQ(heap.object_count(), 0u);
    EXPECT_EQ(heap.next_gc(), config.initial_threshold);
}

TEST(HeapTests, NextThresholdGrowsWithLiveData) {
    HeapConfig config;
    config.initial_threshold = 64;
    config.growth_factor = 2;
    Heap heap(config);
    FixedRoots roots;
    heap.set_root_source(&roots);

    for (int i = 0; i < 50; ++i) {
        roots.objects.push_back(heap.intern("live string " + std::to_string(i)));
    }
    heap.collect();
    EXPECT_EQ(heap.next_gc(), heap.bytes_allocated() * 2);
}

TEST(HeapTests, StressModeAlwaysCollects) {
    HeapConfig config;
    config.stress = true;
    Heap heap(config);
    EXPECT_TRUE(heap.collect_if_needed());
    EXPECT_TRUE(heap.collect_if_needed());
    EXPECT_EQ(heap.stats().collections, 2u);
}

// ============================================================================
// Collection during execution
// ============================================================================

TEST(GcTests, StressedRunMatchesNormalRun) {
    const char* source =
        "fun makeCounter() {\n"
        "  var count = 0;\n"
        "  fun counter() { count = count + 1; return count; }\n"
        "  return counter;\n"
        "}\n"
        "var c = makeCounter();\n"
        "var s = \"\";\n"
        "for (var i = 0; i < 20; i = i + 1) { s = s + \"x\"; c(); }\n"
        "print c();\n"
        "print s;\n"
        "fun fib(n) { if (n < 2) return n; return fib(n - 1) + fib(n - 2); }\n"
        "print fib(12);\n";

    auto normal = run_code(source);
    auto stressed = run_stressed(source);
    ASSERT_TRUE(normal.ok());
    ASSERT_TRUE(stressed.ok()) << stressed.runtime_message();
    EXPECT_EQ(stressed.output, normal.output);
    EXPECT_EQ(stressed.output, "21\nxxxxxxxxxxxxxxxxxxxx\n144\n");
}

TEST(GcTests, StressedOpenUpvaluesStayValid) {
    auto run = run_stressed(
        "fun outer() {\n"
        "  var a = \"a\"; var b = \"b\";\n"
        "  fun f() { return a + b; }\n"
        "  var r = f();\n"
        "  a = \"c\";\n"
        "  return r + f();\n"
        "}\n"
        "print outer();\n");
    ASSERT_TRUE(run.ok()) << run.runtime_message();
    EXPECT_EQ(run.output, "abcb\n");
}

TEST(GcTests, StressModeCountsCollections) {
    VMConfig config;
    config.stress_gc = true;
    VM vm(config);
    auto run = run_on(vm, "var a = 1; print a;");
    ASSERT_TRUE(run.ok());
    EXPECT_GT(vm.get_stats().collections, 0u);
}

TEST(GcTests, ClosureCyclesAreReclaimed) {
    VM vm;
    vm.collect_garbage();
    const size_t baseline = vm.heap().object_count();

    auto run = run_on(vm,
        "for (var i = 0; i < 100; i = i + 1) {\n"
        "  fun selfRef() { return selfRef; }\n"
        "  selfRef();\n"
        "}\n");
    ASSERT_TRUE(run.ok());
    EXPECT_GT(vm.heap().object_count(), baseline);

    vm.collect_garbage();
    EXPECT_EQ(vm.heap().object_count(), baseline);
}

TEST(GcTests, GlobalsAreRoots) {
    VM vm;
    ASSERT_TRUE(run_on(vm, "var keep = \"ke\" + \"pt\"; fun f() { return keep; }").ok());
    vm.collect_garbage();

    auto run = run_on(vm, "print f();");
    ASSERT_TRUE(run.ok());
    EXPECT_EQ(run.output, "kept\n");
}

TEST(GcTests, StatsReport) {
    VM vm;
    ASSERT_TRUE(run_on(vm, "var s = \"a\" + \"b\";").ok());
    std::ostringstream out;
    vm.print_stats(out);
    EXPECT_NE(out.str().find("Memory Statistics"), std::string::npos);
    EXPECT_NE(out.str().find("Globals: 2"), std::string::npos);
}
