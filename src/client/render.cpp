#include "render.hpp"

#include <format>

namespace render {

namespace {

constexpr const char* RED = "\033[31m";
constexpr const char* YELLOW_STRIKE = "\033[33;9m";
constexpr const char* RESET = "\033[0m";

std::string str_or(const nlohmann::json& obj, const char* key, const std::string& fallback) {
    if (obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
    return fallback;
}

} // namespace

std::string display(const nlohmann::json& segments, bool color) {
    std::string out;
    if (!segments.is_array()) return out;

    for (const auto& seg : segments) {
        auto type = str_or(seg, "type", "");
        auto text = str_or(seg, "text", "");
        if (type == "error") {
            out += color ? std::format("{}{}{}", RED, text, RESET) : "{+" + text + "+}";
        } else if (type == "missing") {
            out += color ? std::format("{}{}{}", YELLOW_STRIKE, text, RESET) : "[-" + text + "-]";
        } else {
            out += text;
        }
    }
    return out;
}

std::string record_summary(const nlohmann::json& record) {
    double duration = 0.0;
    if (record.contains("duration") && record["duration"].is_number()) {
        duration = record["duration"].get<double>();
    }
    return std::format("#{} [{}] {} ({:.1f}s) {}",
                       record.value("id", int64_t{0}),
                       str_or(record, "created_at", "?"),
                       str_or(record, "model_used", "?"),
                       duration,
                       str_or(record, "filename", ""));
}

std::string error_line(const nlohmann::json& response) {
    auto line = std::format("{}: {}", str_or(response, "error", "error"),
                            str_or(response, "message", "unknown error"));
    if (response.value("retryable", false)) line += " (retryable)";
    return line;
}

} // namespace render
