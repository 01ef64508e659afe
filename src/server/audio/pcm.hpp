#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

// Boundary audio format: little-endian signed 16-bit PCM, mono, 16 kHz.
namespace pcm {

inline constexpr uint32_t sample_rate_hz = 16000;
inline constexpr size_t chunk_seconds = 10;
inline constexpr size_t samples_per_chunk = sample_rate_hz * chunk_seconds;
inline constexpr size_t bytes_per_sample = 2;

// Divides by INT16_MAX, not 32768. -32768 lands just below -1.0; existing
// clients depend on the exact values, so keep it.
inline constexpr float normalizer = 32767.0f;

enum class DecodeError { EmptyInput, MisalignedLength };

std::string_view describe(DecodeError err);

std::expected<std::vector<float>, DecodeError> decode(std::span<const uint8_t> bytes);
std::expected<std::vector<float>, DecodeError> decode(std::string_view bytes);

// One chunk of zeros, used to warm up an engine.
std::vector<float> silent_chunk();

} // namespace pcm
