/*
 * G.711 Audio Codec (PCMU / PCMA)
 *
 * Segment-based companding from ITU-T G.711. One output byte per 16-bit input
 * sample; every byte decodes on its own, so every unit is a keyframe.
 */

#ifndef G711_H
#define G711_H

#include "encoder.h"
#include <cstdint>

namespace g711 {

uint8_t linear_to_ulaw(int16_t pcm);
int16_t ulaw_to_linear(uint8_t ulaw);

uint8_t linear_to_alaw(int16_t pcm);
int16_t alaw_to_linear(uint8_t alaw);

} // namespace g711

class G711Encoder : public Encoder {
public:
    // codec must be PCMU or PCMA
    explicit G711Encoder(CodecType codec) : codec_(codec) {}

    CodecType type() const override { return codec_; }
    const char* name() const override { return codec_ == CodecType::PCMU ? "PCMU" : "PCMA"; }
    bool init(const EncoderParams& params) override;
    void cleanup() override {}
    bool encode(const Frame& frame, bool force_keyframe, std::vector<EncodedUnit>& out) override;

private:
    CodecType codec_;
    int channels_ = 1;
};

#endif // G711_H
