// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file test_closure.cpp
 * @brief Closures and captured variables.
 */

#include <gtest/gtest.h>

#include "test_helpers.hpp"

using namespace loxvm;
using namespace loxvm::test;

TEST(ClosureTests, CounterKeepsState) {
    auto run = run_code(
        "fun makeCounter() {\n"
        "  var count = 0;\n"
        "  fun counter() { count = count + 1; return count; }\n"
        "  return counter;\n"
        "}\n"
        "var c = makeCounter();\n"
        "print c();\n"
        "print c();\n");
    ASSERT_TRUE(run.ok()) << run.runtime_message();
    EXPECT_EQ(run.output, "1\n2\n");
}

TEST(ClosureTests, IndependentCounters) {
    auto run = run_code(
        "fun makeCounter() {\n"
        "  var count = 0;\n"
        "  fun counter() { count = count + 1; return count; }\n"
        "  return counter;\n"
        "}\n"
        "var a = makeCounter();\n"
        "var b = makeCounter();\n"
        "a(); a();\n"
        "print a();\n"
        "print b();\n");
    ASSERT_TRUE(run.ok());
    EXPECT_EQ(run.output, "3\n1\n");
}

TEST(ClosureTests, CapturesByReference) {
    auto run = run_code(
        "var get; var set;\n"
        "{\n"
        "  var shared = \"initial\";\n"
        "  fun g() { return shared; }\n"
        "  fun s(v) { shared = v; }\n"
        "  get = g; set = s;\n"
        "  shared = \"changed in scope\";\n"
        "  print get();\n"
        "}\n"
        "set(\"changed later\");\n"
        "print get();\n");
    ASSERT_TRUE(run.ok());
    EXPECT_EQ(run.output, "changed in scope\nchanged later\n");
}

TEST(ClosureTests, NestedClosuresReachOuterLocals) {
    auto run = run_code(
        "fun outer() {\n"
        "  var x = \"outer\";\n"
        "  fun middle() {\n"
        "    fun inner() { return x; }\n"
        "    return inner;\n"
        "  }\n"
        "  return middle;\n"
        "}\n"
        "print outer()()();\n");
    ASSERT_TRUE(run.ok());
    EXPECT_EQ(run.output, "outer\n");
}

TEST(ClosureTests, LoopBodyGetsFreshVariable) {
    auto run = run_code(
        "var first; var second;\n"
        "for (var i = 0; i < 2; i = i + 1) {\n"
        "  var j = i;\n"
        "  fun f() { return j; }\n"
        "  if (i == 0) first = f; else second = f;\n"
        "}\n"
        "print first();\n"
        "print second();\n");
    ASSERT_TRUE(run.ok());
    EXPECT_EQ(run.output, "0\n1\n");
}

TEST(ClosureTests, ParameterCapture) {
    auto run = run_code(
        "fun adder(n) { fun add(x) { return x + n; } return add; }\n"
        "var add5 = adder(5);\n"
        "print add5(10);\n");
    ASSERT_TRUE(run.ok());
    EXPECT_EQ(run.output, "15\n");
}

TEST(ClosureTests, ClosedValueOutlivesFrame) {
    auto run = run_code(
        "fun make() { var s = \"kept\"; fun show() { print s; } return show; }\n"
        "var f = make();\n"
        "fun clobber(a, b, c) { return a; }\n"
        "clobber(1, 2, 3);\n"
        "f();\n");
    ASSERT_TRUE(run.ok());
    EXPECT_EQ(run.output, "kept\n");
}

TEST(ClosureTests, SameVariableSharedBetweenClosures) {
    auto run = run_code(
        "fun pair() {\n"
        "  var n = 0;\n"
        "  fun inc() { n = n + 1; }\n"
        "  fun get() { return n; }\n"
        "  inc(); inc();\n"
        "  return get;\n"
        "}\n"
        "print pair()();\n");
    ASSERT_TRUE(run.ok());
    EXPECT_EQ(run.output, "2\n");
}

TEST(ClosureTests, ClosureDisplaysAsFunction) {
    auto run = run_code("fun outer() { fun inner() {} return inner; } print outer();");
    ASSERT_TRUE(run.ok());
    EXPECT_EQ(run.output, "<fun inner>\n");
}

TEST(ClosureTests, EscapedClosureSurvivesRuntimeError) {
    for (bool stress : {false, true}) {
        VMConfig config;
        config.stress_gc = stress;
        VM vm(config);

        auto failed = run_on(vm,
            "var f;\n"
            "fun outer() {\n"
            "  var x = 42;\n"
            "  fun g() { return x; }\n"
            "  f = g;\n"
            "  nil();\n"
            "}\n"
            "outer();\n");
        ASSERT_FALSE(failed.ok());
        EXPECT_EQ(failed.runtime_message(), "Can only call functions.");

        auto after = run_on(vm, "print f();");
        ASSERT_TRUE(after.ok()) << after.runtime_message();
        EXPECT_EQ(after.output, "42\n");

        // New locals reuse the old stack slots and must not alias `x`.
        auto shadowed = run_on(vm, "{ var a = 7; var b = 8; print f(); }");
        ASSERT_TRUE(shadowed.ok()) << shadowed.runtime_message();
        EXPECT_EQ(shadowed.output, "42\n");
    }
}
