#include <catch2/catch_test_macros.hpp>

#include "errors.hpp"
#include "protocol.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST_CASE("Error kinds", "[protocol]") {
    REQUIRE(to_string(ErrorKind::InvalidModel) == "invalid_model");
    REQUIRE(to_string(ErrorKind::BackendUnavailable) == "backend_unavailable");
    REQUIRE(to_string(ErrorKind::DecodeFailure) == "decode_failure");
    REQUIRE(to_string(ErrorKind::InvalidInput) == "invalid_input");
    REQUIRE(to_string(ErrorKind::NotFound) == "not_found");
    REQUIRE(to_string(ErrorKind::Busy) == "busy");

    REQUIRE(is_retryable(ErrorKind::BackendUnavailable));
    REQUIRE(is_retryable(ErrorKind::Busy));
    REQUIRE_FALSE(is_retryable(ErrorKind::InvalidModel));
    REQUIRE_FALSE(is_retryable(ErrorKind::DecodeFailure));
    REQUIRE_FALSE(is_retryable(ErrorKind::Internal));
    REQUIRE(to_string(ErrorKind::Internal) == "internal");

    auto resp = protocol::error_response(Error{ErrorKind::Busy, "queue full"});
    REQUIRE(resp == json{{"status", "error"}, {"error", "busy"}, {"message", "queue full"},
                         {"retryable", true}});
}

TEST_CASE("Protocol encoding", "[protocol]") {

    SECTION("DiffRoundTrip") {
        std::vector<DiffSegment> segs = {{DiffKind::Equal, "a"}, {DiffKind::Delete, "b"}, {DiffKind::Insert, "c"}};
        auto j = protocol::to_json(segs);
        REQUIRE(j[1] == json{{"type", "delete"}, {"text", "b"}});

        auto back = protocol::diff_from_json(j);
        REQUIRE(back.has_value());
        REQUIRE(*back == segs);
    }

    SECTION("DiffFromJsonRejectsJunk") {
        REQUIRE_FALSE(protocol::diff_from_json(json::object()).has_value());
        REQUIRE_FALSE(protocol::diff_from_json(json::parse(R"([{"type":"swap","text":"x"}])")).has_value());
        REQUIRE_FALSE(protocol::diff_from_json(json::parse(R"([{"type":"equal"}])")).has_value());
    }

    SECTION("HistoryEntry") {
        HistoryEntry e{
            .id = 3,
            .created_at = "2024-01-01T00:00:00.000",
            .filename = "a.wav",
            .model_used = "manual",
            .transcription = "hi",
            .reference_text = std::nullopt,
            .duration = 0.5,
            .diff_json = "not json",
        };
        auto j = protocol::to_json(e);
        REQUIRE(j["id"] == 3);
        REQUIRE(j["reference_text"].is_null());
        // A corrupt stored diff does not hide the record
        REQUIRE(j["diff"].is_null());

        e.diff_json = R"([{"type":"equal","text":"hi"}])";
        REQUIRE(protocol::to_json(e)["diff"].size() == 1);
    }

    SECTION("RequireString") {
        json cmd = {{"a", "x"}, {"b", 1}, {"c", nullptr}};
        REQUIRE(protocol::require_string(cmd, "a") == "x");
        REQUIRE(protocol::require_string(cmd, "b").error().message == "b must be a string");
        REQUIRE(protocol::require_string(cmd, "c").error().message == "missing field: c");
        REQUIRE(protocol::require_string(cmd, "d").error().kind == ErrorKind::InvalidInput);
    }
}
