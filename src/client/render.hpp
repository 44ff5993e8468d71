#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace render {

// Inline view of a "display" array. Without color, errors are {+text+} and
// missing reference text is [-text-].
std::string display(const nlohmann::json& segments, bool color);

// One-line summary of a history record.
std::string record_summary(const nlohmann::json& record);

// "error_slug: message", with a retry hint for retryable errors.
std::string error_line(const nlohmann::json& response);

} // namespace render
