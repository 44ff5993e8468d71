#include "orchestrator.hpp"

#include "text/tag_filter.hpp"
#include "text/utf8.hpp"

#include <format>

TranscriptionOrchestrator::TranscriptionOrchestrator(ModelSlot& slot,
                                                     const ScriptConverter& converter,
                                                     size_t max_chunk_samples)
    : slot_(slot), converter_(converter),
      max_chunk_samples_(max_chunk_samples > 0 ? max_chunk_samples : MAX_CHUNK_SAMPLES) {}

std::expected<TranscriptionResult, Error>
TranscriptionOrchestrator::transcribe(std::span<const int16_t> waveform,
                                      const std::string& model_id,
                                      std::chrono::steady_clock::time_point start) {
    auto lease = slot_.acquire(model_id);
    if (!lease) return std::unexpected(lease.error());

    const ModelSpec& spec = lease->spec();
    ModelBackend& backend = lease->backend();

    std::string transcript;
    size_t calls = 0;

    if (waveform.empty()) {
        // Nothing to send; an empty recording is an empty transcript.
    } else if (spec.category == BackendCategory::Native) {
        // The backend segments long audio itself; pre-chunking would cut its context.
        auto res = backend.transcribe(waveform);
        if (!res) return std::unexpected(res.error());
        transcript = std::move(*res);
        calls = 1;
    } else {
        bool post_process = spec.category == BackendCategory::ManualPostProcess;

        for (const auto& chunk : audio::chunk(waveform, max_chunk_samples_)) {
            auto res = backend.transcribe(chunk.samples);
            ++calls;
            if (!res) {
                auto err = res.error();
                err.message = std::format("chunk at {:.1f}s: {}",
                                          static_cast<double>(chunk.offset) / SAMPLE_RATE,
                                          err.message);
                return std::unexpected(std::move(err));
            }

            std::string piece = post_process ? text::strip_tags(*res)
                                             : std::string(utf8::trim(*res));
            transcript += piece;
        }

        // Once over the whole transcript so characters split across chunk
        // boundaries still resolve as phrases.
        if (post_process) {
            transcript = converter_.convert(transcript);
        }
    }

    auto end = std::chrono::steady_clock::now();
    return TranscriptionResult{
        .text = std::move(transcript),
        .model_used = spec.id,
        .elapsed_s = std::chrono::duration<double>(end - start).count(),
        .audio_s = static_cast<double>(waveform.size()) / SAMPLE_RATE,
        .chunks = calls,
    };
}
