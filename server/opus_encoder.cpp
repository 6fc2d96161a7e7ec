/*
 * Opus Audio Encoder Implementation
 */

#include "opus_encoder.h"
#include "config/server_config.h"
#include <cstdio>
#include <cstdlib>

OpusAudioEncoder::~OpusAudioEncoder() {
    cleanup();
}

bool OpusAudioEncoder::init(const EncoderParams& params) {
    cleanup();

    sample_rate_ = params.sample_rate;
    channels_ = params.channels;
    frame_size_ = params.frame_samples;

    // Opus accepts 2.5, 5, 10, 20, 40 or 60 ms frames
    const int per_2_5ms = sample_rate_ / 400;
    if (per_2_5ms <= 0 || frame_size_ % per_2_5ms != 0) {
        last_error_ = "frame of " + std::to_string(frame_size_) + " samples is not a valid Opus frame";
        return false;
    }
    const int units = frame_size_ / per_2_5ms;
    if (units != 1 && units != 2 && units != 4 && units != 8 && units != 16 && units != 24) {
        last_error_ = "frame of " + std::to_string(frame_size_) + " samples is not a valid Opus frame";
        return false;
    }

    int error = OPUS_OK;
    encoder_ = opus_encoder_create(sample_rate_, channels_, OPUS_APPLICATION_AUDIO, &error);
    if (error != OPUS_OK || !encoder_) {
        last_error_ = std::string("failed to create encoder: ") + opus_strerror(error);
        encoder_ = nullptr;
        return false;
    }

    opus_encoder_ctl(encoder_, OPUS_SET_BITRATE(params.bitrate_kbps * 1000));
    opus_encoder_ctl(encoder_, OPUS_SET_COMPLEXITY(params.complexity));
    opus_encoder_ctl(encoder_, OPUS_SET_SIGNAL(OPUS_SIGNAL_TYPE));
    opus_encoder_ctl(encoder_, OPUS_SET_VBR(OPUS_VBR));
    opus_encoder_ctl(encoder_, OPUS_SET_DTX(OPUS_DTX));
    opus_encoder_ctl(encoder_, OPUS_SET_INBAND_FEC(OPUS_INBAND_FEC));
    opus_encoder_ctl(encoder_, OPUS_SET_PACKET_LOSS_PERC(OPUS_PACKET_LOSS_PERC));

    encode_count_ = 0;

    if (server_config::g_debug_media) {
        fprintf(stderr, "[Opus] Encoder initialized: %dHz, %d ch, %d kbps, frame=%d samples\n",
                sample_rate_, channels_, params.bitrate_kbps, frame_size_);
    }
    return true;
}

void OpusAudioEncoder::cleanup() {
    if (encoder_) {
        opus_encoder_destroy(encoder_);
        encoder_ = nullptr;
    }
}

bool OpusAudioEncoder::encode(const Frame& frame, bool force_keyframe, std::vector<EncodedUnit>& out) {
    (void)force_keyframe;  // Every Opus packet is independently decodable

    if (!encoder_) {
        last_error_ = "encoder not initialized";
        return false;
    }
    if (frame.samples != frame_size_ || frame.channels != channels_ ||
        frame.data.size() < static_cast<size_t>(frame_size_) * channels_ * sizeof(int16_t)) {
        last_error_ = "frame size mismatch: expected " + std::to_string(frame_size_) +
                      " samples, got " + std::to_string(frame.samples);
        return false;
    }

    if (server_config::g_debug_media && encode_count_ % 50 == 0) {
        const int16_t* pcm = frame.pcm();
        int64_t energy = 0;
        for (int i = 0; i < frame_size_ * channels_; i++) {
            energy += abs(pcm[i]);
        }
        fprintf(stderr, "[Opus] Encode #%llu: frame_size=%d, energy=%lld\n",
                (unsigned long long)encode_count_, frame_size_, (long long)energy);
    }
    encode_count_++;

    EncodedUnit unit;
    unit.pts = frame.pts;
    unit.timebase = frame.timebase;
    unit.is_keyframe = true;
    unit.data.resize(OPUS_MAX_PACKET_BYTES);

    int encoded_bytes = opus_encode(encoder_, frame.pcm(), frame_size_,
                                    unit.data.data(), static_cast<opus_int32>(unit.data.size()));
    if (encoded_bytes < 0) {
        last_error_ = std::string("encode error: ") + opus_strerror(encoded_bytes);
        return false;
    }

    unit.data.resize(encoded_bytes);
    out.push_back(std::move(unit));
    return true;
}
