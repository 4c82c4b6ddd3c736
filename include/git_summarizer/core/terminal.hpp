#pragma once

namespace git_summarizer {

/// Returns true if stderr is a terminal. Decides whether log output is colored;
/// stdout is always the protocol channel and is never inspected.
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve the final color decision from --color / --no-color and the environment.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace git_summarizer
