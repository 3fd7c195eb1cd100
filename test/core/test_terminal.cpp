#include <catch2/catch_test_macros.hpp>

#include <mssql_mcp/core/terminal.hpp>

using namespace mssql_mcp;

// ===========================================================================
// Terminal detection: basic smoke tests.
// ===========================================================================

TEST_CASE("IsStderrTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStderrTty();
    CHECK((result == true || result == false));
}

TEST_CASE("ResolveLogColor: explicit choice wins", "[core][terminal]") {
    CHECK(ResolveLogColor(true));
    CHECK_FALSE(ResolveLogColor(false));
}

TEST_CASE("ResolveLogColor: auto never colors without a terminal",
          "[core][terminal]") {
    if (!IsStderrTty() || NoColorEnvSet()) {
        CHECK_FALSE(ResolveLogColor(std::nullopt));
    }
}
