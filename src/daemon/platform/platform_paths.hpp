#pragma once

#include <string>

namespace platform {

// Per-user directories; empty when they cannot be determined.
std::string config_dir();
std::string data_dir();

// Address the daemon listens on and the client connects to.
std::string ipc_endpoint();

} // namespace platform
