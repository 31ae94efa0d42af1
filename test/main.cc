//
// Main entry point for the doctest test runner.
// Test cases live in the test_*.cc files of each component directory.
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>
