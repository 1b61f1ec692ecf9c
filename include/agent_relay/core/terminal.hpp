#pragma once

namespace agent_relay {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (help and console channel).
bool IsStdoutTty();

/// Returns true if stdin is a terminal (console channel prompt).
bool IsStdinTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Color decision for log output: explicit flag wins, then NO_COLOR, then TTY.
bool ShouldUseColor(int color_flag);

} // namespace agent_relay
