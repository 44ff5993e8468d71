#include "protocol.hpp"

using json = nlohmann::json;

namespace protocol {

json error_response(const Error& err) {
    return {
        {"status", "error"},
        {"error", to_string(err.kind)},
        {"message", err.message},
        {"retryable", is_retryable(err.kind)},
    };
}

json to_json(const std::vector<DiffSegment>& segments) {
    json arr = json::array();
    for (const auto& seg : segments) {
        arr.push_back({{"type", to_string(seg.kind)}, {"text", seg.text}});
    }
    return arr;
}

json to_json(const std::vector<DisplaySegment>& segments) {
    json arr = json::array();
    for (const auto& seg : segments) {
        arr.push_back({{"type", to_string(seg.kind)}, {"text", seg.text}});
    }
    return arr;
}

json to_json(const ModelSpec& spec) {
    return {
        {"id", spec.id},
        {"name", spec.name},
        {"description", spec.description},
        {"category", to_string(spec.category)},
    };
}

json to_json(const HistoryEntry& e) {
    json diff = nullptr;
    if (e.diff_json) {
        // Stored by us; a corrupt row still shows the rest of the record.
        diff = json::parse(*e.diff_json, nullptr, false);
        if (diff.is_discarded()) diff = nullptr;
    }
    return {
        {"id", e.id},
        {"created_at", e.created_at},
        {"filename", e.filename},
        {"model_used", e.model_used},
        {"transcription", e.transcription},
        {"reference_text", e.reference_text ? json(*e.reference_text) : json(nullptr)},
        {"duration", e.duration},
        {"diff", diff},
    };
}

std::expected<std::vector<DiffSegment>, Error> diff_from_json(const json& j) {
    if (!j.is_array()) {
        return std::unexpected(Error{ErrorKind::InvalidInput, "diff must be an array"});
    }
    std::vector<DiffSegment> out;
    for (const auto& item : j) {
        if (!item.is_object() || !item.contains("type") || !item.contains("text") ||
            !item["type"].is_string() || !item["text"].is_string()) {
            return std::unexpected(Error{ErrorKind::InvalidInput, "malformed diff segment"});
        }
        auto type = item["type"].get<std::string>();
        DiffKind kind;
        if (type == "equal") kind = DiffKind::Equal;
        else if (type == "insert") kind = DiffKind::Insert;
        else if (type == "delete") kind = DiffKind::Delete;
        else return std::unexpected(Error{ErrorKind::InvalidInput, "unknown diff type: " + type});
        out.push_back({kind, item["text"].get<std::string>()});
    }
    return out;
}

std::expected<std::string, Error> require_string(const json& cmd, const char* field) {
    if (!cmd.contains(field) || cmd[field].is_null()) {
        return std::unexpected(Error{ErrorKind::InvalidInput, std::string("missing field: ") + field});
    }
    if (!cmd[field].is_string()) {
        return std::unexpected(Error{ErrorKind::InvalidInput, std::string(field) + " must be a string"});
    }
    return cmd[field].get<std::string>();
}

} // namespace protocol
