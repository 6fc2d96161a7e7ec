/*
 * Encoder Stage
 *
 * Wraps one Encoder with the stream-level policy:
 * - every Nth input frame (0, N, 2N, ...) is forced to be a keyframe
 * - H.264 parameter sets are either repeated inline on every keyframe or
 *   stripped from the stream and published out of band
 * - output units are checked to leave in non-decreasing timestamp order
 *
 * encode() runs on the media chain's strand. request_keyframe() and the
 * parameter set accessors may be called from the dispatch loop.
 */

#ifndef ENCODER_STAGE_H
#define ENCODER_STAGE_H

#include "encoder.h"
#include "status.h"
#include "config/stream_config.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

class EncoderStage {
public:
    EncoderStage(CodecType codec, const config::EncoderConfig& cfg, std::unique_ptr<Encoder> encoder);

    Status init(const EncoderParams& params);

    // Encode one frame, appending zero or more units to `out`
    Status encode(const Frame& frame, std::vector<EncodedUnit>& out);

    // Force the next frame to be a keyframe (new subscriber on a running pipeline)
    void request_keyframe() { keyframe_requested_.store(true); }

    // H.264: latest SPS/PPS seen (without start codes). False until known.
    bool parameter_sets(std::vector<uint8_t>& sps, std::vector<uint8_t>& pps) const;

    int keyframe_interval() const { return cfg_.keyframe_interval; }
    bool repeats_parameter_sets() const { return cfg_.repeat_parameter_sets; }

    uint64_t frames_in() const { return frames_in_.load(); }
    uint64_t keyframes_out() const { return keyframes_out_.load(); }

private:
    void apply_parameter_set_policy(EncodedUnit& unit);
    void cache_parameter_sets(const uint8_t* data, size_t size);

    CodecType codec_;
    config::EncoderConfig cfg_;
    std::unique_ptr<Encoder> encoder_;

    int64_t frame_index_ = 0;
    bool have_last_pts_ = false;
    int64_t last_pts_ = 0;
    std::atomic<bool> keyframe_requested_{false};

    mutable std::mutex param_mutex_;
    std::vector<uint8_t> sps_;
    std::vector<uint8_t> pps_;

    std::atomic<uint64_t> frames_in_{0};
    std::atomic<uint64_t> units_out_{0};
    std::atomic<uint64_t> keyframes_out_{0};
};

#endif // ENCODER_STAGE_H
