#pragma once

#include "backend.hpp"

#include <string>

// Speech-recognition server reached over HTTP: a whisper.cpp `server`
// (/inference, /load) or any OpenAI-compatible /v1/audio/transcriptions endpoint.
class ServerBackend : public ModelBackend {
public:
    explicit ServerBackend(ModelSpec spec);
    ~ServerBackend() override;

    ServerBackend(const ServerBackend&) = delete;
    ServerBackend& operator=(const ServerBackend&) = delete;

    std::expected<void, Error> load() override;

    std::expected<std::string, Error>
        transcribe(std::span<const int16_t> samples) override;

    // Extracts the trimmed "text" field from a server reply.
    static std::expected<std::string, Error> parse_response(const std::string& body);

private:
    ModelSpec spec_;
};
