/*
 * Opus Audio Encoder
 *
 * Handles:
 * - 8/12/16/24/48kHz input, mono or stereo
 * - One Opus packet per input frame (2.5 - 60ms)
 */

#ifndef OPUS_ENCODER_H
#define OPUS_ENCODER_H

#include "encoder.h"
#include "audio_config.h"
#include <opus/opus.h>

class OpusAudioEncoder : public Encoder {
public:
    OpusAudioEncoder() = default;
    ~OpusAudioEncoder() override;

    CodecType type() const override { return CodecType::OPUS; }
    const char* name() const override { return "Opus"; }
    bool init(const EncoderParams& params) override;
    void cleanup() override;
    bool encode(const Frame& frame, bool force_keyframe, std::vector<EncodedUnit>& out) override;

    // Get frame size in samples per channel
    int get_frame_size() const { return frame_size_; }

private:
    OpusEncoder* encoder_ = nullptr;
    int sample_rate_ = 48000;
    int channels_ = 1;
    int frame_size_ = 960;
    uint64_t encode_count_ = 0;
};

#endif // OPUS_ENCODER_H
