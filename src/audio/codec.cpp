#include "clinic_voice/audio/codec.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

#include <websocketpp/base64/base64.hpp>

#include "clinic_voice/logging.hpp"

namespace clinic_voice::audio {

namespace {

std::array<int16_t, 256> build_expansion_table() {
    std::array<int16_t, 256> table{};
    for (int i = 0; i < 256; ++i) {
        const int value = ~i & 0xFF;
        int magnitude = ((value & 0x0F) << 3) + kUlawBias;
        magnitude <<= (value & 0x70) >> 4;
        table[i] = static_cast<int16_t>((value & 0x80) ? (kUlawBias - magnitude)
                                                       : (magnitude - kUlawBias));
    }
    return table;
}

const std::array<int16_t, 256>& expansion_table() {
    static const auto table = build_expansion_table();
    return table;
}

int16_t clamp_sample(long value) {
    return static_cast<int16_t>(std::clamp<long>(value, -32768, 32767));
}

bool is_base64_char(unsigned char ch) {
    return std::isalnum(ch) || ch == '+' || ch == '/';
}

bool is_valid_base64(const std::string& text) {
    if (text.empty() || text.size() % 4 != 0) {
        return false;
    }
    size_t padding = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const auto ch = static_cast<unsigned char>(text[i]);
        if (ch == '=') {
            ++padding;
            continue;
        }
        if (padding > 0 || !is_base64_char(ch)) {
            return false;
        }
    }
    return padding <= 2;
}

}

int16_t ulaw_to_linear(uint8_t value) {
    return expansion_table()[value];
}

uint8_t linear_to_ulaw(int16_t sample) {
    int magnitude = sample;
    const int sign = (magnitude >> 8) & 0x80;
    if (sign != 0) {
        magnitude = -magnitude;
    }
    magnitude = std::min(magnitude, kUlawClip);
    magnitude += kUlawBias;

    int exponent = 7;
    for (int mask = 0x4000; (magnitude & mask) == 0 && exponent > 0; mask >>= 1) {
        --exponent;
    }
    const int mantissa = (magnitude >> (exponent + 3)) & 0x0F;
    return static_cast<uint8_t>(~(sign | (exponent << 4) | mantissa));
}

Pcm16 decode(const UlawBytes& frame, double gain) {
    Pcm16 pcm;
    pcm.reserve(frame.size());
    const auto& table = expansion_table();
    for (auto byte : frame) {
        const auto sample = table[byte];
        if (gain == 1.0) {
            pcm.push_back(sample);
        } else {
            pcm.push_back(clamp_sample(std::lround(sample * gain)));
        }
    }
    return pcm;
}

UlawBytes encode(const Pcm16& pcm) {
    UlawBytes frame;
    frame.reserve(pcm.size());
    for (auto sample : pcm) {
        frame.push_back(linear_to_ulaw(sample));
    }
    return frame;
}

Pcm16 upsample_8k_to_16k(const Pcm16& pcm) {
    Pcm16 result;
    result.reserve(pcm.size() * 2);
    for (auto sample : pcm) {
        result.push_back(sample);
        result.push_back(sample);
    }
    return result;
}

Pcm16 downsample_16k_to_8k(const Pcm16& pcm) {
    Pcm16 result;
    result.reserve(pcm.size() / 2);
    for (size_t i = 0; i + 1 < pcm.size(); i += 2) {
        const int sum = static_cast<int>(pcm[i]) + static_cast<int>(pcm[i + 1]);
        const int average = sum >= 0 ? sum / 2 : -((-sum + 1) / 2);
        result.push_back(static_cast<int16_t>(average));
    }
    return result;
}

std::string to_le_bytes(const Pcm16& pcm) {
    std::string bytes;
    bytes.resize(pcm.size() * 2);
    for (size_t i = 0; i < pcm.size(); ++i) {
        const auto value = static_cast<uint16_t>(pcm[i]);
        bytes[i * 2] = static_cast<char>(value & 0xFF);
        bytes[i * 2 + 1] = static_cast<char>((value >> 8) & 0xFF);
    }
    return bytes;
}

std::optional<UlawBytes> decode_payload(const std::string& base64) {
    if (!is_valid_base64(base64)) {
        logging::warn("Dropping malformed media payload", {kv("length", base64.size())});
        return std::nullopt;
    }
    const auto raw = websocketpp::base64_decode(base64);
    if (raw.empty()) {
        logging::warn("Dropping empty media payload");
        return std::nullopt;
    }
    return UlawBytes(raw.begin(), raw.end());
}

std::string encode_payload(const UlawBytes& frame) {
    return websocketpp::base64_encode(frame.data(), frame.size());
}

}
