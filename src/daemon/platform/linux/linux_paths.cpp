#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <format>
#include <unistd.h>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/whisper-control";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/whisper-control";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/whisper-control";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/whisper-control";
}

std::string ipc_endpoint() {
    if (const char* sock = std::getenv("WHISPER_CONTROL_SOCKET"); sock && *sock) return sock;
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/whisper-control.sock";
    return std::format("/tmp/whisper-control-{}.sock", getuid());
}

} // namespace platform
