#include <catch2/catch_test_macros.hpp>

#include "audio/pcm.hpp"
#include "audio/wav_encoder.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace {

// Read a little-endian uint16 from raw bytes.
uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

// Read a little-endian uint32 from raw bytes.
uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<float> samples = {0.0f, 0.5f, -0.5f, 1.0f, -1.0f};

    SECTION("HeaderMagic") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(read_tag(wav.data()) == "RIFF");
        REQUIRE(read_tag(wav.data() + 8) == "WAVE");
        REQUIRE(read_tag(wav.data() + 12) == "fmt ");
        REQUIRE(read_tag(wav.data() + 36) == "data");
    }

    SECTION("HeaderFields") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(wav.size() == 44 + samples.size() * 2);

        // fmt chunk size
        REQUIRE(read_u32(wav.data() + 16) == 16);
        // PCM format, mono
        REQUIRE(read_u16(wav.data() + 20) == 1);
        REQUIRE(read_u16(wav.data() + 22) == 1);
        REQUIRE(read_u32(wav.data() + 24) == sample_rate);
        REQUIRE(read_u32(wav.data() + 28) == sample_rate * 2);
        REQUIRE(read_u16(wav.data() + 32) == 2);
        REQUIRE(read_u16(wav.data() + 34) == 16);

        uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
        REQUIRE(read_u32(wav.data() + 40) == data_size);
        // RIFF chunk size = file_size - 8
        REQUIRE(read_u32(wav.data() + 4) == 36 + data_size);
    }

    SECTION("DataIsInt16") {
        auto wav = wav::encode(samples, sample_rate);
        std::vector<int16_t> expected = {0, 16384, -16384, 32767, -32767};
        for (size_t i = 0; i < expected.size(); ++i) {
            REQUIRE(static_cast<int16_t>(read_u16(wav.data() + 44 + i * 2)) == expected[i]);
        }
    }

    SECTION("DecodedPcmSurvivesReencoding") {
        std::vector<uint8_t> raw = {0x34, 0x12, 0x00, 0x80, 0xFF, 0xFF};
        auto decoded = pcm::decode(raw);
        REQUIRE(decoded.has_value());

        auto wav = wav::encode(*decoded, sample_rate);
        REQUIRE(std::memcmp(wav.data() + 44, raw.data(), raw.size()) == 0);
    }

    SECTION("EmptySamples") {
        std::vector<float> empty;
        auto wav = wav::encode(empty, sample_rate);
        REQUIRE(wav.size() == 44);
        REQUIRE(read_u32(wav.data() + 40) == 0);
    }
}

TEST_CASE("wav::to_pcm16", "[wav]") {
    REQUIRE(wav::to_pcm16(0.0f) == 0);
    REQUIRE(wav::to_pcm16(1.0f) == 32767);
    REQUIRE(wav::to_pcm16(-1.0f) == -32767);
    // Out-of-range samples clamp.
    REQUIRE(wav::to_pcm16(2.0f) == 32767);
    REQUIRE(wav::to_pcm16(-2.0f) == -32768);
}
