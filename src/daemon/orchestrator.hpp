#pragma once

#include "asr/model_slot.hpp"
#include "audio/chunker.hpp"
#include "errors.hpp"
#include "text/script_converter.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

struct TranscriptionResult {
    std::string text;
    std::string model_used;
    double elapsed_s = 0.0; // wall clock from the caller's start time
    double audio_s = 0.0;
    size_t chunks = 0;      // backend calls made
};

class TranscriptionOrchestrator {
public:
    TranscriptionOrchestrator(ModelSlot& slot, const ScriptConverter& converter,
                              size_t max_chunk_samples = MAX_CHUNK_SAMPLES);

    // Runs one request end to end. Any backend failure aborts the whole
    // request; no partial transcript is returned.
    std::expected<TranscriptionResult, Error>
        transcribe(std::span<const int16_t> waveform, const std::string& model_id,
                   std::chrono::steady_clock::time_point start);

private:
    ModelSlot& slot_;
    const ScriptConverter& converter_;
    size_t max_chunk_samples_;
};
