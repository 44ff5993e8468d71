#include <catch2/catch_test_macros.hpp>

#include "audio/wav.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// Read a little-endian uint16 from raw bytes.
uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

// Read a little-endian uint32 from raw bytes.
uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

void put(std::vector<uint8_t>& out, const void* p, size_t n) {
    auto* b = static_cast<const uint8_t*>(p);
    out.insert(out.end(), b, b + n);
}

void put_u16(std::vector<uint8_t>& out, uint16_t v) { put(out, &v, 2); }
void put_u32(std::vector<uint8_t>& out, uint32_t v) { put(out, &v, 4); }

// Hand-built RIFF file with an optional chunk between fmt and data.
std::vector<uint8_t> make_wav(uint16_t format, uint16_t channels, uint32_t rate, uint16_t bits,
                              const std::vector<uint8_t>& data,
                              const std::string& extra_tag = "",
                              const std::vector<uint8_t>& extra = {}) {
    std::vector<uint8_t> out;
    put(out, "RIFF", 4);
    put_u32(out, 0); // patched below
    put(out, "WAVE", 4);

    put(out, "fmt ", 4);
    put_u32(out, 16);
    put_u16(out, format);
    put_u16(out, channels);
    put_u32(out, rate);
    put_u32(out, rate * channels * bits / 8);
    put_u16(out, static_cast<uint16_t>(channels * bits / 8));
    put_u16(out, bits);

    if (!extra_tag.empty()) {
        put(out, extra_tag.data(), 4);
        put_u32(out, static_cast<uint32_t>(extra.size()));
        put(out, extra.data(), extra.size());
        if (extra.size() & 1) out.push_back(0);
    }

    put(out, "data", 4);
    put_u32(out, static_cast<uint32_t>(data.size()));
    put(out, data.data(), data.size());

    uint32_t riff_size = static_cast<uint32_t>(out.size() - 8);
    std::memcpy(out.data() + 4, &riff_size, 4);
    return out;
}

std::vector<uint8_t> pcm16(const std::vector<int16_t>& samples) {
    std::vector<uint8_t> out;
    for (auto s : samples) put(out, &s, 2);
    return out;
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("HeaderMagic") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(read_tag(wav.data()) == "RIFF");
        REQUIRE(read_tag(wav.data() + 8) == "WAVE");
        REQUIRE(read_tag(wav.data() + 12) == "fmt ");
        REQUIRE(read_tag(wav.data() + 36) == "data");
        REQUIRE(wav.size() == 44 + samples.size() * 2);
    }

    SECTION("HeaderFields") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(read_u16(wav.data() + 20) == 1);
        REQUIRE(read_u16(wav.data() + 22) == 1);
        REQUIRE(read_u32(wav.data() + 24) == sample_rate);
        REQUIRE(read_u32(wav.data() + 28) == sample_rate * 2);
        REQUIRE(read_u16(wav.data() + 34) == 16);
        REQUIRE(read_u32(wav.data() + 40) == samples.size() * 2);
    }

    SECTION("EmptySamples") {
        std::vector<int16_t> empty;
        auto wav = wav::encode(empty, sample_rate);
        REQUIRE(wav.size() == 44);
        REQUIRE(read_u32(wav.data() + 40) == 0);
    }
}

TEST_CASE("wav::decode", "[wav]") {

    SECTION("Mono16PassesThrough") {
        std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};
        auto res = wav::decode(wav::encode(samples, 16000), 16000);
        REQUIRE(res.has_value());
        REQUIRE(res->samples == samples);
        REQUIRE(res->source_rate == 16000);
        REQUIRE(res->channels == 1);
        REQUIRE(res->duration_s == 5.0 / 16000);
    }

    SECTION("StereoIsAveraged") {
        auto bytes = make_wav(1, 2, 16000, 16, pcm16({1000, 3000, -2000, -4000}));
        auto res = wav::decode(bytes, 16000);
        REQUIRE(res.has_value());
        REQUIRE(res->channels == 2);
        REQUIRE(res->samples == std::vector<int16_t>{2000, -3000});
    }

    SECTION("Float32") {
        std::vector<uint8_t> data;
        for (float f : {0.5f, -0.25f, 1.5f}) put(data, &f, 4);
        auto res = wav::decode(make_wav(3, 1, 16000, 32, data), 16000);
        REQUIRE(res.has_value());
        // Out-of-range floats clamp
        REQUIRE(res->samples == std::vector<int16_t>{16384, -8192, 32767});
    }

    SECTION("NonFiniteFloatsAreSilence") {
        std::vector<uint8_t> data;
        for (float f : {std::numeric_limits<float>::quiet_NaN(), 0.5f,
                        std::numeric_limits<float>::infinity(), -std::numeric_limits<float>::infinity()}) {
            put(data, &f, 4);
        }
        auto res = wav::decode(make_wav(3, 1, 16000, 32, data), 16000);
        REQUIRE(res.has_value());
        REQUIRE(res->samples == std::vector<int16_t>{0, 16384, 0, 0});

        // A NaN does not leak into interpolated neighbours
        auto up = wav::decode(make_wav(3, 1, 8000, 32, data), 16000);
        REQUIRE(up.has_value());
        for (auto s : up->samples) REQUIRE(s >= 0);
    }

    SECTION("Unsigned8") {
        auto res = wav::decode(make_wav(1, 1, 16000, 8, {128, 0, 192}), 16000);
        REQUIRE(res.has_value());
        REQUIRE(res->samples == std::vector<int16_t>{0, -32768, 16384});
    }

    SECTION("Signed24") {
        std::vector<uint8_t> data = {0x00, 0x01, 0x00,   // 256
                                     0x00, 0xFF, 0xFF};  // -256
        auto res = wav::decode(make_wav(1, 1, 16000, 24, data), 16000);
        REQUIRE(res.has_value());
        REQUIRE(res->samples == std::vector<int16_t>{1, -1});
    }

    SECTION("UpsampledLinearly") {
        auto bytes = make_wav(1, 1, 8000, 16, pcm16({0, 1000, 2000, 3000}));
        auto res = wav::decode(bytes, 16000);
        REQUIRE(res.has_value());
        REQUIRE(res->source_rate == 8000);
        REQUIRE(res->samples == std::vector<int16_t>{0, 500, 1000, 1500, 2000, 2500, 3000, 3000});
        REQUIRE(res->duration_s == 4.0 / 8000);
    }

    SECTION("SkipsUnknownChunks") {
        auto bytes = make_wav(1, 1, 16000, 16, pcm16({42}), "LIST", {1, 2, 3});
        auto res = wav::decode(bytes, 16000);
        REQUIRE(res.has_value());
        REQUIRE(res->samples == std::vector<int16_t>{42});
    }

    SECTION("RejectsGarbage") {
        std::vector<uint8_t> junk = {'n', 'o', 't', ' ', 'a', ' ', 'w', 'a', 'v', 'e', '!', '!'};
        auto res = wav::decode(junk, 16000);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "not a RIFF/WAVE file");
    }

    SECTION("RejectsUnsupportedEncoding") {
        auto res = wav::decode(make_wav(1, 1, 16000, 12, {0, 0}), 16000);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().starts_with("unsupported encoding"));
    }

    SECTION("RejectsMissingData") {
        auto bytes = make_wav(1, 1, 16000, 16, {});
        bytes.resize(bytes.size() - 8); // drop the data chunk header
        auto res = wav::decode(bytes, 16000);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "missing data chunk");
    }

    SECTION("DecodeFile") {
        auto path = std::filesystem::temp_directory_path() /
                    ("vd_test_wav_" + std::to_string(getpid()) + ".wav");
        auto bytes = wav::encode(std::vector<int16_t>{1, 2, 3}, 16000);
        {
            std::ofstream f(path, std::ios::binary);
            f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        }
        auto res = wav::decode_file(path.string(), 16000);
        std::filesystem::remove(path);
        REQUIRE(res.has_value());
        REQUIRE(res->samples == std::vector<int16_t>{1, 2, 3});

        auto missing = wav::decode_file("/tmp/vd_test_no_such_file.wav", 16000);
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error().starts_with("could not open"));
    }
}
