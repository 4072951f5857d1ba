#include <catch2/catch_test_macros.hpp>

#include <skills_mcp/core/terminal.hpp>

using namespace skills_mcp;

TEST_CASE("IsStderrTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStderrTty();
    CHECK((result == true || result == false));
}

TEST_CASE("ShouldUseColor: explicit choice wins", "[core][terminal]") {
    CHECK(ShouldUseColor(true, false, true));
    CHECK_FALSE(ShouldUseColor(false, true, false));
}

TEST_CASE("ShouldUseColor: auto-detect", "[core][terminal]") {
    CHECK(ShouldUseColor(std::nullopt, true, false));
    CHECK_FALSE(ShouldUseColor(std::nullopt, true, true));
    CHECK_FALSE(ShouldUseColor(std::nullopt, false, false));
}
