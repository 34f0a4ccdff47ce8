#pragma once

namespace mcp_bridge {

// How the console log sink decides on ANSI colors.
enum class ColorChoice {
    Auto,    // color only on a terminal
    Always,  // --color
    Never,   // --no-color
};

// --no-color wins when both flags are given.
ColorChoice ColorChoiceFromFlags(bool color, bool no_color);

bool StderrIsTerminal();

// NO_COLOR set to any value (https://no-color.org/).
bool NoColorRequested();

// NO_COLOR overrides Always as well as Auto.
bool UseColor(ColorChoice choice, bool is_terminal, bool no_color_env);

// UseColor() against the real stderr and environment.
bool UseColorOnStderr(ColorChoice choice);

} // namespace mcp_bridge
