#pragma once

#include <cstdint>

namespace textdiff {

enum class TerminalColorCapability : uint16_t {
    None,
    Ansi4bit,   // 16 color palette
    Ansi24bit,  // 24 bit true color
};

// Whether the stream is attached to a terminal.
bool
tty_is_terminal(int fd);

// Colors we can send to stdout. None when stdout is redirected.
TerminalColorCapability
tty_get_color_capability();

}  // namespace textdiff
