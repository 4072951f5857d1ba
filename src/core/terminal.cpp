#include <skills_mcp/core/terminal.hpp>

#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace skills_mcp {

bool IsStderrTty() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(STDERR_FILENO) != 0;
#endif
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ShouldUseColor(std::optional<bool> forced, bool stderr_tty, bool no_color_env) {
    if (forced) {
        return *forced;
    }
    return stderr_tty && !no_color_env;
}

bool ShouldUseColor(std::optional<bool> forced) {
    return ShouldUseColor(forced, IsStderrTty(), NoColorEnvSet());
}

} // namespace skills_mcp
