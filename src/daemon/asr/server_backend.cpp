#include "server_backend.hpp"

#include "../audio/chunker.hpp"
#include "../audio/wav.hpp"
#include "../text/utf8.hpp"

#include <curl/curl.h>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static void add_field(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

static Error unavailable(std::string message) {
    return Error{ErrorKind::BackendUnavailable, std::move(message)};
}

// POSTs a multipart form and returns the response body; non-2xx is an error.
static std::expected<std::string, Error>
post_form(const std::string& endpoint, curl_mime* mime, CURL* curl, long timeout_s) {
    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        return std::unexpected(unavailable(std::string("curl error: ") + curl_easy_strerror(res)));
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        return std::unexpected(unavailable(std::format("HTTP {} from {}: {}", status, endpoint,
                                                       utf8::trim(response_body))));
    }
    return response_body;
}

ServerBackend::ServerBackend(ModelSpec spec) : spec_(std::move(spec)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

ServerBackend::~ServerBackend() {
    curl_global_cleanup();
}

std::expected<void, Error> ServerBackend::load() {
    if (spec_.model_path.empty() || spec_.api_format != "whisper.cpp") {
        return {};
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(unavailable("curl_easy_init failed"));
    }

    curl_mime* mime = curl_mime_init(curl);
    add_field(mime, "model", spec_.model_path);

    // Swapping weights on the server can take a while.
    auto res = post_form(spec_.url + "/load", mime, curl, 300L);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (!res) return std::unexpected(res.error());
    return {};
}

std::expected<std::string, Error>
ServerBackend::transcribe(std::span<const int16_t> samples) {
    if (samples.empty()) {
        return std::unexpected(Error{ErrorKind::InvalidInput, "empty audio"});
    }

    auto wav_data = wav::encode(samples, SAMPLE_RATE);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(unavailable("curl_easy_init failed"));
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    if (spec_.api_format == "openai") {
        endpoint = spec_.url + "/v1/audio/transcriptions";
        add_field(mime, "model", spec_.model_path.empty() ? spec_.id : spec_.model_path);
    } else {
        // whisper.cpp server format
        endpoint = spec_.url + "/inference";
        add_field(mime, "temperature", "0.0");
    }
    add_field(mime, "response_format", "json");
    if (!spec_.language.empty()) {
        add_field(mime, "language", spec_.language);
    }

    auto body = post_form(endpoint, mime, curl, 300L);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (!body) return std::unexpected(body.error());
    return parse_response(*body);
}

std::expected<std::string, Error> ServerBackend::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (j.contains("text") && j["text"].is_string()) {
            return std::string(utf8::trim(j["text"].get<std::string>()));
        }
        if (j.contains("error")) {
            const auto& err = j["error"];
            // OpenAI nests the message: {"error": {"message": ...}}
            std::string msg = err.is_object() ? err.value("message", err.dump())
                            : err.is_string() ? err.get<std::string>()
                            : err.dump();
            return std::unexpected(unavailable("server error: " + msg));
        }
        return std::unexpected(unavailable("unexpected response: " + body));
    } catch (const json::exception& e) {
        return std::unexpected(unavailable(std::string("JSON parse error: ") + e.what()));
    }
}
