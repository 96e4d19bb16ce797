#pragma once

// Include this header in exactly ONE .cpp file per test executable.
// It defines main() and hands control to the test registry.
//
// Example:
//   // timer/test.cpp
//   #include "../testing/test_main.hpp"
//   #include "timer.hxx"
//   TEST_SUITE("timer")
//   ...
//
// An optional first argument selects the tests whose "suite/name" contains it:
//   ./timer_test "pause"

#include <optional>
#include <string>

#include "test_framework.hpp"

auto main(int argc, char* argv[]) -> int {
    std::optional<std::string> selector;
    if (argc > 1) {
        selector = argv[1];
    }
    return ::rangebench::testing::test_registry::instance().run_all(selector);
}
