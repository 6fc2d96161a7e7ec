/*
 * G.711 Audio Codec Implementation
 */

#include "g711.h"

namespace g711 {

namespace {

const int ULAW_BIAS = 0x84;
const int ULAW_CLIP = 32635;

// Upper bounds of the 8 A-law segments (13-bit magnitude)
const int ALAW_SEG_END[8] = {0x1F, 0x3F, 0x7F, 0xFF, 0x1FF, 0x3FF, 0x7FF, 0xFFF};

} // namespace

uint8_t linear_to_ulaw(int16_t pcm) {
    int value = pcm;
    int sign = 0;
    if (value < 0) {
        sign = 0x80;
        value = -value;
    }
    if (value > ULAW_CLIP) value = ULAW_CLIP;
    value += ULAW_BIAS;

    // Position of the highest set bit above bit 7 gives the segment
    int exponent = 7;
    for (int mask = 0x4000; (value & mask) == 0 && exponent > 0; mask >>= 1) {
        exponent--;
    }
    int mantissa = (value >> (exponent + 3)) & 0x0F;
    return static_cast<uint8_t>(~(sign | (exponent << 4) | mantissa));
}

int16_t ulaw_to_linear(uint8_t ulaw) {
    int u = ~ulaw & 0xFF;
    int t = ((u & 0x0F) << 3) + ULAW_BIAS;
    t <<= (u & 0x70) >> 4;
    return static_cast<int16_t>((u & 0x80) ? (ULAW_BIAS - t) : (t - ULAW_BIAS));
}

uint8_t linear_to_alaw(int16_t pcm) {
    int value = pcm >> 3;
    int mask;
    if (value >= 0) {
        mask = 0xD5;   // Sign bit set, even bits inverted
    } else {
        mask = 0x55;
        value = -value - 1;
    }

    int seg = 0;
    while (seg < 8 && value > ALAW_SEG_END[seg]) {
        seg++;
    }
    if (seg >= 8) {
        return static_cast<uint8_t>(0x7F ^ mask);
    }

    int aval = seg << 4;
    if (seg < 2) {
        aval |= (value >> 1) & 0x0F;
    } else {
        aval |= (value >> seg) & 0x0F;
    }
    return static_cast<uint8_t>(aval ^ mask);
}

int16_t alaw_to_linear(uint8_t alaw) {
    int a = alaw ^ 0x55;
    int t = (a & 0x0F) << 4;
    int seg = (a & 0x70) >> 4;
    switch (seg) {
        case 0:
            t += 8;
            break;
        case 1:
            t += 0x108;
            break;
        default:
            t += 0x108;
            t <<= seg - 1;
            break;
    }
    return static_cast<int16_t>((a & 0x80) ? t : -t);
}

} // namespace g711

bool G711Encoder::init(const EncoderParams& params) {
    if (codec_ != CodecType::PCMU && codec_ != CodecType::PCMA) {
        last_error_ = "G.711 encoder needs PCMU or PCMA";
        return false;
    }
    if (params.channels < 1) {
        last_error_ = "invalid channel count";
        return false;
    }
    channels_ = params.channels;
    return true;
}

bool G711Encoder::encode(const Frame& frame, bool force_keyframe, std::vector<EncodedUnit>& out) {
    (void)force_keyframe;

    const size_t count = static_cast<size_t>(frame.samples) * channels_;
    if (frame.channels != channels_ || frame.data.size() < count * sizeof(int16_t)) {
        last_error_ = "frame does not match encoder channel layout";
        return false;
    }

    EncodedUnit unit;
    unit.pts = frame.pts;
    unit.timebase = frame.timebase;
    unit.is_keyframe = true;
    unit.data.resize(count);

    const int16_t* pcm = frame.pcm();
    if (codec_ == CodecType::PCMU) {
        for (size_t i = 0; i < count; i++) unit.data[i] = g711::linear_to_ulaw(pcm[i]);
    } else {
        for (size_t i = 0; i < count; i++) unit.data[i] = g711::linear_to_alaw(pcm[i]);
    }

    out.push_back(std::move(unit));
    return true;
}
