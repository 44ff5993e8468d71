#include "wav.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>

namespace wav {

namespace {

constexpr uint16_t FORMAT_PCM = 1;
constexpr uint16_t FORMAT_FLOAT = 3;
constexpr uint16_t FORMAT_EXTENSIBLE = 0xFFFE;

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

// One sample normalized to [-1, 1].
float sample_at(const uint8_t* p, uint16_t format, uint16_t bits) {
    if (format == FORMAT_FLOAT) {
        float f;
        std::memcpy(&f, p, 4);
        // NaN and infinity decode as silence
        return std::isfinite(f) ? f : 0.0f;
    }
    switch (bits) {
        case 8:
            return (static_cast<float>(p[0]) - 128.0f) / 128.0f;
        case 16:
            return static_cast<float>(static_cast<int16_t>(read_u16(p))) / 32768.0f;
        case 24: {
            int32_t v = static_cast<int32_t>(p[0] | (p[1] << 8) | (p[2] << 16));
            if (v & 0x800000) v |= ~0xFFFFFF;
            return static_cast<float>(v) / 8388608.0f;
        }
        case 32:
            return static_cast<float>(static_cast<int32_t>(read_u32(p))) / 2147483648.0f;
    }
    return 0.0f;
}

std::vector<float> resample_linear(const std::vector<float>& in, uint32_t from, uint32_t to) {
    if (from == to || in.empty()) return in;

    size_t out_len = static_cast<size_t>(
        static_cast<double>(in.size()) * to / from);
    std::vector<float> out(out_len);
    double step = static_cast<double>(from) / to;
    for (size_t i = 0; i < out_len; ++i) {
        double pos = i * step;
        size_t i0 = static_cast<size_t>(pos);
        size_t i1 = std::min(i0 + 1, in.size() - 1);
        double frac = pos - static_cast<double>(i0);
        out[i] = static_cast<float>(in[i0] * (1.0 - frac) + in[i1] * frac);
    }
    return out;
}

} // namespace

std::expected<DecodedAudio, std::string>
decode(std::span<const uint8_t> bytes, uint32_t target_rate) {
    if (bytes.size() < 12 || !tag_is(bytes.data(), "RIFF") || !tag_is(bytes.data() + 8, "WAVE")) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t rate = 0;
    uint16_t bits = 0;
    bool have_fmt = false;
    std::span<const uint8_t> data;
    bool have_data = false;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* hdr = bytes.data() + pos;
        size_t size = read_u32(hdr + 4);
        size_t body = pos + 8;
        size_t avail = bytes.size() - body;

        if (tag_is(hdr, "fmt ")) {
            if (size < 16 || size > avail) return std::unexpected("truncated fmt chunk");
            format = read_u16(bytes.data() + body);
            channels = read_u16(bytes.data() + body + 2);
            rate = read_u32(bytes.data() + body + 4);
            bits = read_u16(bytes.data() + body + 14);
            if (format == FORMAT_EXTENSIBLE) {
                if (size < 26) return std::unexpected("truncated extensible fmt chunk");
                // First two bytes of the sub-format GUID carry the real format tag.
                format = read_u16(bytes.data() + body + 24);
            }
            have_fmt = true;
        } else if (tag_is(hdr, "data")) {
            // Streaming writers leave the size unset; take what is there.
            data = bytes.subspan(body, std::min(size, avail));
            have_data = true;
            break;
        }

        pos = body + size + (size & 1);
    }

    if (!have_fmt) return std::unexpected("missing fmt chunk");
    if (!have_data) return std::unexpected("missing data chunk");
    if (channels == 0 || rate == 0) return std::unexpected("invalid channel count or sample rate");

    bool supported = (format == FORMAT_PCM && (bits == 8 || bits == 16 || bits == 24 || bits == 32)) ||
                     (format == FORMAT_FLOAT && bits == 32);
    if (!supported) {
        return std::unexpected(std::format("unsupported encoding (format {}, {} bits)", format, bits));
    }

    size_t frame_bytes = static_cast<size_t>(bits / 8) * channels;
    size_t frames = data.size() / frame_bytes;

    std::vector<float> mono(frames);
    for (size_t f = 0; f < frames; ++f) {
        const uint8_t* frame = data.data() + f * frame_bytes;
        float sum = 0.0f;
        for (uint16_t c = 0; c < channels; ++c) {
            sum += sample_at(frame + c * (bits / 8), format, bits);
        }
        mono[f] = sum / channels;
    }

    auto resampled = resample_linear(mono, rate, target_rate);

    DecodedAudio out;
    out.samples.resize(resampled.size());
    std::transform(resampled.begin(), resampled.end(), out.samples.begin(), [](float v) {
        float scaled = std::round(v * 32768.0f);
        return static_cast<int16_t>(std::clamp(scaled, -32768.0f, 32767.0f));
    });
    out.source_rate = rate;
    out.channels = channels;
    out.duration_s = static_cast<double>(frames) / rate;
    return out;
}

std::expected<DecodedAudio, std::string>
decode_file(const std::string& path, uint32_t target_rate) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("could not open " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (bytes.empty()) {
        return std::unexpected("empty audio file");
    }
    return decode(bytes, target_rate);
}

} // namespace wav
