#include <catch2/catch_test_macros.hpp>

#include <mcp_bridge/core/terminal.hpp>

using namespace mcp_bridge;

TEST_CASE("ColorChoiceFromFlags: flag combinations", "[core][terminal]") {
    CHECK(ColorChoiceFromFlags(false, false) == ColorChoice::Auto);
    CHECK(ColorChoiceFromFlags(true, false) == ColorChoice::Always);
    CHECK(ColorChoiceFromFlags(false, true) == ColorChoice::Never);
    CHECK(ColorChoiceFromFlags(true, true) == ColorChoice::Never);
}

TEST_CASE("UseColor: auto follows the terminal", "[core][terminal]") {
    CHECK(UseColor(ColorChoice::Auto, true, false));
    CHECK_FALSE(UseColor(ColorChoice::Auto, false, false));
}

TEST_CASE("UseColor: explicit choices ignore the terminal", "[core][terminal]") {
    CHECK(UseColor(ColorChoice::Always, false, false));
    CHECK_FALSE(UseColor(ColorChoice::Never, true, false));
}

TEST_CASE("UseColor: NO_COLOR disables every choice", "[core][terminal]") {
    CHECK_FALSE(UseColor(ColorChoice::Auto, true, true));
    CHECK_FALSE(UseColor(ColorChoice::Always, true, true));
    CHECK_FALSE(UseColor(ColorChoice::Never, false, true));
}

TEST_CASE("UseColorOnStderr: agrees with the process state", "[core][terminal]") {
    CHECK(UseColorOnStderr(ColorChoice::Always) == !NoColorRequested());
    CHECK_FALSE(UseColorOnStderr(ColorChoice::Never));
    CHECK(UseColorOnStderr(ColorChoice::Auto) ==
          (!NoColorRequested() && StderrIsTerminal()));
}
