/*
 * G.722 Audio Encoder Implementation
 */

#include "g722_encoder.h"
#include "audio_config.h"
#include "config/server_config.h"
#include <cstdio>
#include <spandsp.h>

G722Encoder::~G722Encoder() {
    cleanup();
}

bool G722Encoder::init(const EncoderParams& params) {
    cleanup();

    if (params.sample_rate != G722_SAMPLE_RATE || params.channels != 1) {
        last_error_ = "G.722 needs 16000 Hz mono input, got " + std::to_string(params.sample_rate) +
                      " Hz x" + std::to_string(params.channels);
        return false;
    }
    if (params.frame_samples % 2 != 0) {
        last_error_ = "G.722 frame must hold an even number of samples";
        return false;
    }

    // 64 kbit/s, 16 kHz input, one code word per output byte
    state_ = g722_encode_init(nullptr, G722_BIT_RATE, 0);
    if (!state_) {
        last_error_ = "failed to create G.722 encoder state";
        return false;
    }
    encode_count_ = 0;

    if (server_config::g_debug_media) {
        fprintf(stderr, "[G722] Encoder initialized: %d bit/s, frame=%d samples\n",
                G722_BIT_RATE, params.frame_samples);
    }
    return true;
}

void G722Encoder::cleanup() {
    if (state_) {
        g722_encode_free(state_);
        state_ = nullptr;
    }
}

bool G722Encoder::encode(const Frame& frame, bool force_keyframe, std::vector<EncodedUnit>& out) {
    (void)force_keyframe;

    if (!state_) {
        last_error_ = "G.722 encoder not initialized";
        return false;
    }
    if (frame.channels != 1 || frame.samples % 2 != 0 ||
        frame.data.size() < static_cast<size_t>(frame.samples) * sizeof(int16_t)) {
        last_error_ = "G.722 frame must be mono with an even sample count";
        return false;
    }

    EncodedUnit unit;
    unit.pts = frame.pts;
    unit.timebase = frame.timebase;
    unit.is_keyframe = true;
    unit.data.resize(frame.samples / 2);

    int bytes = g722_encode(state_, unit.data.data(), frame.pcm(), frame.samples);
    if (bytes != frame.samples / 2) {
        last_error_ = "G.722 encode produced " + std::to_string(bytes) + " bytes for " +
                      std::to_string(frame.samples) + " samples";
        return false;
    }

    encode_count_++;
    if (server_config::g_debug_media && encode_count_ % 500 == 0) {
        fprintf(stderr, "[G722] %llu frames encoded\n", (unsigned long long)encode_count_);
    }

    out.push_back(std::move(unit));
    return true;
}
