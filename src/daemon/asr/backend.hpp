#pragma once

#include "../errors.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

// How the orchestrator must feed a backend.
enum class BackendCategory {
    Native,            // takes arbitrarily long audio in one call
    Manual,            // at most one chunk per call
    ManualPostProcess, // manual, plus tag stripping and script conversion
};

std::string_view to_string(BackendCategory category);
std::optional<BackendCategory> parse_category(std::string_view name);

struct ModelSpec {
    std::string id;
    std::string name;
    std::string description;
    BackendCategory category = BackendCategory::Manual;
    std::string url = "http://localhost:8080";
    std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
    std::string language;                   // empty: server auto-detects
    std::string model_path;                 // passed to the server's /load when set
};

class ModelBackend {
public:
    virtual ~ModelBackend() = default;

    // Makes the model resident. Called once by ModelSlot before first use.
    virtual std::expected<void, Error> load() { return {}; }

    // Samples are mono int16 at SAMPLE_RATE.
    virtual std::expected<std::string, Error>
        transcribe(std::span<const int16_t> samples) = 0;
};
