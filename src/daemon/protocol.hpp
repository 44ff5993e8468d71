#pragma once

#include "alignment/alignment.hpp"
#include "asr/backend.hpp"
#include "errors.hpp"
#include "storage/history_db.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace protocol {

nlohmann::json error_response(const Error& err);

nlohmann::json to_json(const std::vector<DiffSegment>& segments);
nlohmann::json to_json(const std::vector<DisplaySegment>& segments);
nlohmann::json to_json(const ModelSpec& spec);
nlohmann::json to_json(const HistoryEntry& entry);

// Parses a stored diff back into segments; InvalidInput on malformed JSON.
std::expected<std::vector<DiffSegment>, Error> diff_from_json(const nlohmann::json& j);

// Reads a required string field. A missing or null field is InvalidInput.
std::expected<std::string, Error> require_string(const nlohmann::json& cmd, const char* field);

} // namespace protocol
