#pragma once

#include <string>

namespace platform {

// Per-user config directory, empty if it cannot be determined.
std::string config_dir();

// Default IPC endpoint (socket path) shared by daemon and client.
std::string ipc_endpoint();

} // namespace platform
