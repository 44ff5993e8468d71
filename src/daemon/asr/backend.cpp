#include "backend.hpp"

std::string_view to_string(BackendCategory category) {
    switch (category) {
        case BackendCategory::Native: return "native";
        case BackendCategory::Manual: return "manual";
        case BackendCategory::ManualPostProcess: return "manual_post_process";
    }
    return "manual";
}

std::optional<BackendCategory> parse_category(std::string_view name) {
    if (name == "native") return BackendCategory::Native;
    if (name == "manual") return BackendCategory::Manual;
    if (name == "manual_post_process") return BackendCategory::ManualPostProcess;
    return std::nullopt;
}
