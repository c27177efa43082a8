#include "tty.hpp"

#include <cstdlib>
#include <string>

#ifdef TEXTDIFF_PLATFORM_POSIX
#include <unistd.h>
#endif

using namespace textdiff;

bool
textdiff::tty_is_terminal(int fd) {
#ifdef TEXTDIFF_PLATFORM_POSIX
    return isatty(fd) != 0;
#else
    (void) fd;
    return false;
#endif
}

TerminalColorCapability
textdiff::tty_get_color_capability() {
    // If we're not outputting to a terminal, we don't output any colors.
    // NOTE: This will prevent colored output when piping to less or when
    //       redirecting to files.
    if (!tty_is_terminal(1)) {
        return TerminalColorCapability::None;
    }

    // https://no-color.org
    if (const char* no_color = getenv("NO_COLOR"); no_color != nullptr && no_color[0] != '\0') {
        return TerminalColorCapability::None;
    }

    // The COLORTERM variable is usually available to indicate 24bit color support.
    if (const char* colorterm_var = getenv("COLORTERM"); colorterm_var != nullptr) {
        const std::string colorterm(colorterm_var);
        if (colorterm == "24bit" || colorterm == "truecolor") {
            return TerminalColorCapability::Ansi24bit;
        }
    }

    const char* term_var = getenv("TERM");
    if (term_var == nullptr || std::string(term_var) == "dumb") {
        return TerminalColorCapability::None;
    }
    return TerminalColorCapability::Ansi4bit;
}
