//
// Main entry point for doctest test runner.
// All test cases are defined in separate test_*.cc files.
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>
