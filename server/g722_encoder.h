/*
 * G.722 Audio Encoder
 *
 * ITU-T G.722 at 64 kbit/s through spandsp: 16kHz mono input, one output
 * byte per two input samples.
 */

#ifndef G722_ENCODER_H
#define G722_ENCODER_H

#include "encoder.h"

struct g722_encode_state_s;

class G722Encoder : public Encoder {
public:
    G722Encoder() = default;
    ~G722Encoder() override;

    CodecType type() const override { return CodecType::G722; }
    const char* name() const override { return "G.722"; }
    bool init(const EncoderParams& params) override;
    void cleanup() override;
    bool encode(const Frame& frame, bool force_keyframe, std::vector<EncodedUnit>& out) override;

private:
    g722_encode_state_s* state_ = nullptr;
    uint64_t encode_count_ = 0;
};

#endif // G722_ENCODER_H
