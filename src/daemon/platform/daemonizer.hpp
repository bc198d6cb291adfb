#pragma once

#include <string>

namespace platform {

// Detaches from the terminal. stderr goes to `log_path` (appended), or nowhere if empty.
void daemonize(const std::string& log_path);

} // namespace platform
