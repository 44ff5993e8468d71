#pragma once

#include "asr/backend.hpp"
#include "audio/chunker.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// STPhrases.txt and STCharacters.txt in platform::dictionary_dir(). These are
// the plain-text dictionaries from OpenCC's source tree; distribution packages
// ship only the compiled .ocd2 forms.
std::vector<std::string> default_dictionaries();

struct Config {
    struct Server {
        std::string socket_path; // empty: platform::ipc_endpoint()
        size_t max_queue = 8;
    } server;

    struct Audio {
        uint32_t max_chunk_seconds = 30;

        // Waveforms are always SAMPLE_RATE mono; only the window length is tunable.
        size_t max_chunk_samples() const {
            return static_cast<size_t>(max_chunk_seconds) * SAMPLE_RATE;
        }
    } audio;

    std::vector<ModelSpec> models = default_models();
    std::string default_model = "faster-whisper";

    struct Script {
        std::vector<std::string> dictionaries = default_dictionaries();
    } script;

    struct History {
        bool enabled = true;
        std::string path; // empty: platform::data_dir() + "/history.db"
    } history;

    static Config load(const std::string& path);
    static Config load_default();

    static std::vector<ModelSpec> default_models();
};
