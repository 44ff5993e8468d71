#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <format>
#include <optional>
#include <string_view>
#include <unistd.h>

namespace platform {

namespace {

constexpr std::string_view APP_NAME = "voxdiff";

// XDG base directory variables count only when set to an absolute path.
std::optional<std::string> absolute_env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || value[0] != '/') return std::nullopt;
    return std::string(value);
}

// $<xdg_var>/voxdiff, else $HOME/<home_rel>/voxdiff.
std::string app_dir(const char* xdg_var, std::string_view home_rel) {
    if (auto base = absolute_env(xdg_var)) return std::format("{}/{}", *base, APP_NAME);
    auto home = absolute_env("HOME");
    if (!home) return {};
    return std::format("{}/{}/{}", *home, home_rel, APP_NAME);
}

} // namespace

std::string config_dir() {
    return app_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return app_dir("XDG_DATA_HOME", ".local/share");
}

std::string dictionary_dir() {
    auto dir = data_dir();
    return dir.empty() ? dir : dir + "/opencc";
}

std::string ipc_endpoint() {
    if (auto runtime = absolute_env("XDG_RUNTIME_DIR")) return std::format("{}/{}.sock", *runtime, APP_NAME);
    // Shared /tmp: keep one socket per user.
    return std::format("/tmp/{}-{}.sock", APP_NAME, ::getuid());
}

} // namespace platform
