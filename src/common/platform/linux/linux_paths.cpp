#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

// Unset and empty variables are treated alike.
const char* env(const char* name) {
    const char* value = std::getenv(name);
    return value && *value ? value : nullptr;
}

} // namespace

std::string config_dir() {
    if (const char* xdg = env("XDG_CONFIG_HOME")) return std::string(xdg) + "/dictation";
    if (const char* home = env("HOME")) return std::string(home) + "/.config/dictation";
    return {};
}

std::string ipc_endpoint() {
    if (const char* runtime = env("XDG_RUNTIME_DIR")) return std::string(runtime) + "/dictation.sock";
    return "/tmp/dictation.sock";
}

} // namespace platform
