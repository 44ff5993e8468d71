#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::vector<ModelSpec> Config::default_models() {
    return {
        {
            .id = "faster-whisper",
            .name = "Faster Whisper",
            .description = "General multilingual speech recognition (Large V3)",
            .category = BackendCategory::Native,
            .url = "http://localhost:8000",
            .api_format = "openai",
            .model_path = "large-v3",
        },
        {
            .id = "whisper-taiwanese",
            .name = "Whisper Taiwanese",
            .description = "Optimized for Traditional Chinese (Taiwan)",
            .category = BackendCategory::Manual,
            .url = "http://localhost:8080",
            .api_format = "whisper.cpp",
            .language = "zh",
            .model_path = "models/ggml-whisper-large-v3-turbo-zh-TW.bin",
        },
        {
            .id = "formospeech",
            .name = "FormoSpeech Hakka",
            .description = "Specialized for Hakka language",
            .category = BackendCategory::Manual,
            .url = "http://localhost:8080",
            .api_format = "whisper.cpp",
            .language = "zh",
            .model_path = "models/ggml-whisper-large-v3-taiwanese-hakka.bin",
        },
        {
            .id = "dolphin-taiwanese",
            .name = "Dolphin Taiwanese",
            .description = "Taiwanese (Minnan) recognition with Traditional Chinese output",
            .category = BackendCategory::ManualPostProcess,
            .url = "http://localhost:8090",
            .api_format = "openai",
            .language = "zh",
            .model_path = "dolphin-small",
        },
    };
}

std::vector<std::string> default_dictionaries() {
    auto dir = platform::dictionary_dir();
    if (dir.empty()) return {};
    return {dir + "/STPhrases.txt", dir + "/STCharacters.txt"};
}

static bool parse_model(const json& m, ModelSpec& spec) {
    if (!m.is_object() || !m.contains("id") || !m["id"].is_string()) return false;

    spec.id = m["id"].get<std::string>();
    spec.name = m.value("name", spec.id);
    spec.description = m.value("description", "");
    if (m.contains("category")) {
        if (!m["category"].is_string()) return false;
        auto cat = parse_category(m["category"].get<std::string>());
        if (!cat) return false;
        spec.category = *cat;
    }
    if (m.contains("url")) spec.url = m["url"].get<std::string>();
    if (m.contains("api_format")) spec.api_format = m["api_format"].get<std::string>();
    if (m.contains("language")) spec.language = m["language"].get<std::string>();
    if (m.contains("model_path")) spec.model_path = m["model_path"].get<std::string>();
    return true;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("socket_path")) cfg.server.socket_path = s["socket_path"].get<std::string>();
            if (s.contains("max_queue")) cfg.server.max_queue = s["max_queue"].get<size_t>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("max_chunk_seconds")) cfg.audio.max_chunk_seconds = a["max_chunk_seconds"].get<uint32_t>();
        }

        if (j.contains("models")) {
            std::vector<ModelSpec> models;
            for (auto& m : j["models"]) {
                ModelSpec spec;
                if (parse_model(m, spec)) {
                    models.push_back(std::move(spec));
                } else {
                    std::println(stderr, "config: skipping invalid model entry: {}", m.dump());
                }
            }
            cfg.models = std::move(models);
        }

        if (j.contains("default_model")) cfg.default_model = j["default_model"].get<std::string>();

        if (j.contains("script")) {
            auto& s = j["script"];
            if (s.contains("dictionaries")) {
                cfg.script.dictionaries = s["dictionaries"].get<std::vector<std::string>>();
            }
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
            if (h.contains("path")) cfg.history.path = h["path"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.server.max_queue == 0) {
        std::println(stderr, "config: server.max_queue must be positive, using 8");
        cfg.server.max_queue = 8;
    }

    if (cfg.audio.max_chunk_seconds == 0) {
        std::println(stderr, "config: audio.max_chunk_seconds must be positive, using 30");
        cfg.audio.max_chunk_seconds = 30;
    }

    bool default_known = std::ranges::any_of(cfg.models, [&](const ModelSpec& m) {
        return m.id == cfg.default_model;
    });
    if (!default_known && !cfg.models.empty()) {
        std::println(stderr, "config: default_model {} is not in the catalog, using {}",
                     cfg.default_model, cfg.models.front().id);
        cfg.default_model = cfg.models.front().id;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
