#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clinic_voice {
namespace audio {

using UlawBytes = std::vector<uint8_t>;
using Pcm16 = std::vector<int16_t>;

constexpr int kCarrierSampleRate = 8000;
constexpr int kUlawBias = 0x84;
constexpr int kUlawClip = 32635;

int16_t ulaw_to_linear(uint8_t value);
uint8_t linear_to_ulaw(int16_t sample);

// Expands a mu-law frame to PCM16, scaling by gain and clamping to int16.
Pcm16 decode(const UlawBytes& frame, double gain = 1.0);
UlawBytes encode(const Pcm16& pcm);

Pcm16 upsample_8k_to_16k(const Pcm16& pcm);
// Pairwise average with floor rounding; a trailing odd sample is dropped.
Pcm16 downsample_16k_to_8k(const Pcm16& pcm);

// Little endian byte image of the samples, as streamed to the recognizer.
std::string to_le_bytes(const Pcm16& pcm);

// Decodes a base64 media payload. Empty or malformed payloads yield nullopt.
std::optional<UlawBytes> decode_payload(const std::string& base64);
std::string encode_payload(const UlawBytes& frame);

}
}
