#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

constexpr uint32_t SAMPLE_RATE = 16000;
constexpr size_t MAX_CHUNK_SAMPLES = 30 * SAMPLE_RATE;

// A view into the caller's waveform; valid only while that buffer lives.
struct AudioChunk {
    size_t offset = 0;
    std::span<const int16_t> samples;
};

namespace audio {

// Splits the waveform into consecutive windows of max_samples; the last one
// may be shorter. An empty waveform gives no chunks. max_samples must be > 0.
std::vector<AudioChunk> chunk(std::span<const int16_t> waveform, size_t max_samples);

} // namespace audio
