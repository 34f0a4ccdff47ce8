#include <mcp_bridge/core/terminal.hpp>

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace mcp_bridge {

ColorChoice ColorChoiceFromFlags(bool color, bool no_color) {
    if (no_color) {
        return ColorChoice::Never;
    }
    return color ? ColorChoice::Always : ColorChoice::Auto;
}

bool StderrIsTerminal() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(STDERR_FILENO) != 0;
#endif
}

bool NoColorRequested() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool UseColor(ColorChoice choice, bool is_terminal, bool no_color_env) {
    if (no_color_env) {
        return false;
    }
    switch (choice) {
        case ColorChoice::Always: return true;
        case ColorChoice::Never:  return false;
        case ColorChoice::Auto:   return is_terminal;
    }
    return false;
}

bool UseColorOnStderr(ColorChoice choice) {
    return UseColor(choice, StderrIsTerminal(), NoColorRequested());
}

} // namespace mcp_bridge
