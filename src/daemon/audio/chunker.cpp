#include "chunker.hpp"

#include <algorithm>

namespace audio {

std::vector<AudioChunk> chunk(std::span<const int16_t> waveform, size_t max_samples) {
    std::vector<AudioChunk> chunks;
    if (max_samples == 0 || waveform.empty()) return chunks;

    chunks.reserve((waveform.size() + max_samples - 1) / max_samples);
    for (size_t offset = 0; offset < waveform.size(); offset += max_samples) {
        size_t count = std::min(max_samples, waveform.size() - offset);
        chunks.push_back({.offset = offset, .samples = waveform.subspan(offset, count)});
    }
    return chunks;
}

} // namespace audio
