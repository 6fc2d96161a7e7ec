/*
 * H.264 Encoder using OpenH264
 *
 * Baseline profile, single slice, no B-frames, so every input frame yields
 * exactly one access unit in Annex B form. IDR placement is left entirely to
 * the caller (automatic intra period disabled).
 */

#ifndef H264_ENCODER_H
#define H264_ENCODER_H

#include "encoder.h"
#include <wels/codec_api.h>

class H264Encoder : public Encoder {
public:
    H264Encoder() = default;
    ~H264Encoder() override { cleanup(); }

    CodecType type() const override { return CodecType::H264; }
    const char* name() const override { return "H.264"; }
    bool init(const EncoderParams& params) override;
    void cleanup() override;
    bool encode(const Frame& frame, bool force_keyframe, std::vector<EncodedUnit>& out) override;
    bool decoder_config(std::vector<uint8_t>& out) override;

private:
    ISVCEncoder* encoder_ = nullptr;
    int width_ = 0;
    int height_ = 0;
    uint64_t frame_count_ = 0;
    uint64_t idr_count_ = 0;
};

#endif // H264_ENCODER_H
