#include <agent_relay/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace agent_relay {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool IsStdoutTty() {
    return isatty(STDOUT_FILENO) != 0;
}

bool IsStdinTty() {
    return isatty(STDIN_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

// color_flag: 1 = --color, 0 = --no-color, -1 = auto
bool ShouldUseColor(int color_flag) {
    if (color_flag == 1) return true;
    if (color_flag == 0) return false;
    if (NoColorEnvSet()) return false;
    return IsStderrTty();
}

} // namespace agent_relay
