#pragma once

#include <optional>

namespace skills_mcp {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

// Decide whether console logs get ANSI colors. An explicit --color /
// --no-color (or logging.color) wins; otherwise color only on a TTY
// without NO_COLOR.
bool ShouldUseColor(std::optional<bool> forced, bool stderr_tty, bool no_color_env);

// Same, probing the current process's stderr and environment.
bool ShouldUseColor(std::optional<bool> forced);

} // namespace skills_mcp
