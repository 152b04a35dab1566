#include "util/tty.hpp"

#include <cstdlib>
#include <string>

#include <unistd.h>

bool
nestdiff::tty_stdout_supports_color() {
    // NOTE: This also disables colors when piping to less or redirecting to files.
    if (isatty(STDOUT_FILENO) == 0) {
        return false;
    }

    if (getenv("NO_COLOR") != nullptr) {
        return false;
    }

    const char* term_var = getenv("TERM");
    if (term_var == nullptr) {
        return false;
    }

    const std::string term(term_var);
    return !term.empty() && term != "dumb";
}
