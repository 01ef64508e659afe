#include "audio/pcm.hpp"

namespace pcm {

std::string_view describe(DecodeError err) {
    switch (err) {
        case DecodeError::EmptyInput: return "Empty audio payload";
        case DecodeError::MisalignedLength: return "PCM byte length must be even";
    }
    return "invalid PCM payload";
}

std::expected<std::vector<float>, DecodeError> decode(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return std::unexpected(DecodeError::EmptyInput);
    }
    if (bytes.size() % bytes_per_sample != 0) {
        return std::unexpected(DecodeError::MisalignedLength);
    }

    std::vector<float> samples(bytes.size() / bytes_per_sample);
    for (size_t i = 0; i < samples.size(); ++i) {
        auto lo = static_cast<uint16_t>(bytes[2 * i]);
        auto hi = static_cast<uint16_t>(bytes[2 * i + 1]);
        auto value = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
        samples[i] = static_cast<float>(value) / normalizer;
    }
    return samples;
}

std::expected<std::vector<float>, DecodeError> decode(std::string_view bytes) {
    return decode(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()));
}

std::vector<float> silent_chunk() {
    return std::vector<float>(samples_per_chunk, 0.0f);
}

} // namespace pcm
