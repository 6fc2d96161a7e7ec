/*
 * VP8 Encoder using libvpx
 * Real-time, no lookahead, keyframes only when forced
 */

#ifndef VP8_ENCODER_H
#define VP8_ENCODER_H

#include "encoder.h"
#include <vpx/vpx_encoder.h>
#include <vpx/vp8cx.h>

class VP8Encoder : public Encoder {
public:
    VP8Encoder() = default;
    ~VP8Encoder() override { cleanup(); }

    CodecType type() const override { return CodecType::VP8; }
    const char* name() const override { return "VP8"; }
    bool init(const EncoderParams& params) override;
    void cleanup() override;
    bool encode(const Frame& frame, bool force_keyframe, std::vector<EncodedUnit>& out) override;

private:
    vpx_codec_ctx_t encoder_ = {};
    vpx_codec_enc_cfg_t config_ = {};

    int width_ = 0;
    int height_ = 0;
    bool initialized_ = false;
    uint64_t frame_count_ = 0;
};

#endif // VP8_ENCODER_H
