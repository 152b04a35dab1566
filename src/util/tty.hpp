#pragma once

namespace nestdiff {

// Is stdout a terminal that understands ANSI colors? False when piping or
// redirecting, when TERM is "dumb", or when NO_COLOR is set.
bool
tty_stdout_supports_color();

}  // namespace nestdiff
