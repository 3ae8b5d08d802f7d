// Test main file - Catch2 provides main() function
// This file is intentionally minimal as Catch2WithMain handles everything

#include <catch2/catch_test_macros.hpp>

#include "app/Version.hpp"

#include <string>

// Simple smoke test to verify test framework is working
TEST_CASE("Framework smoke test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
    REQUIRE_FALSE(std::string(WORDCHEF_VERSION_STRING).empty());
}
