/*
 * Encoder Stage Implementation
 */

#include "encoder_stage.h"
#include "h264_nal.h"
#include "config/server_config.h"
#include <cstdio>
#include <exception>

EncoderStage::EncoderStage(CodecType codec, const config::EncoderConfig& cfg,
                           std::unique_ptr<Encoder> encoder)
    : codec_(codec)
    , cfg_(cfg)
    , encoder_(std::move(encoder))
{
    if (cfg_.keyframe_interval < 1) {
        cfg_.keyframe_interval = 1;
    }
}

Status EncoderStage::init(const EncoderParams& params) {
    if (!encoder_) {
        return Status(ErrorCode::EncoderInitFailure,
                      std::string("no encoder for codec ") + codec_name(codec_));
    }
    if (!encoder_->init(params)) {
        return Status(ErrorCode::EncoderInitFailure,
                      std::string(encoder_->name()) + ": " + encoder_->last_error());
    }

    frame_index_ = 0;
    have_last_pts_ = false;

    // Prime the parameter set cache so it can be published before the first IDR
    std::vector<uint8_t> config;
    if (encoder_->decoder_config(config)) {
        cache_parameter_sets(config.data(), config.size());
    }
    return Status::ok();
}

Status EncoderStage::encode(const Frame& frame, std::vector<EncodedUnit>& out) {
    const bool force = (frame_index_ % cfg_.keyframe_interval) == 0 ||
                       (frame.flags & (FRAME_FLAG_KEYFRAME | FRAME_FLAG_DISCONT)) != 0 ||
                       keyframe_requested_.exchange(false);
    frame_index_++;
    frames_in_++;

    const size_t first = out.size();
    bool encoded = false;
    try {
        encoded = encoder_->encode(frame, force, out);
    } catch (const std::exception& e) {
        // Codec library threw; reported like any other encode failure
        out.resize(first);
        return Status(ErrorCode::EncodeFailure, std::string(encoder_->name()) + ": " + e.what());
    }
    if (!encoded) {
        out.resize(first);
        return Status(ErrorCode::EncodeFailure,
                      std::string(encoder_->name()) + ": " + encoder_->last_error());
    }

    for (size_t i = first; i < out.size(); i++) {
        EncodedUnit& unit = out[i];

        if (have_last_pts_ && unit.pts < last_pts_) {
            out.resize(first);
            return Status(ErrorCode::EncodeFailure,
                          "unit pts " + std::to_string(unit.pts) + " precedes " + std::to_string(last_pts_));
        }
        have_last_pts_ = true;
        last_pts_ = unit.pts;

        if (codec_ == CodecType::H264) {
            apply_parameter_set_policy(unit);
        }

        units_out_++;
        if (unit.is_keyframe && codec_media_kind(codec_) == MediaKind::Video) {
            keyframes_out_++;
        }
    }

    if (server_config::g_debug_perf && frames_in_ % 300 == 0) {
        fprintf(stderr, "[Encoder] %s: frames=%llu units=%llu keyframes=%llu\n",
                encoder_->name(), (unsigned long long)frames_in_.load(),
                (unsigned long long)units_out_.load(), (unsigned long long)keyframes_out_.load());
    }
    return Status::ok();
}

void EncoderStage::apply_parameter_set_policy(EncodedUnit& unit) {
    std::vector<h264::NalRef> nals = h264::split_annexb(unit.data.data(), unit.data.size());

    bool has_sps = false;
    bool has_pps = false;
    for (const auto& nal : nals) {
        if (nal.type == h264::NAL_SPS) has_sps = true;
        if (nal.type == h264::NAL_PPS) has_pps = true;
    }
    if (has_sps || has_pps) {
        cache_parameter_sets(unit.data.data(), unit.data.size());
    }

    if (cfg_.repeat_parameter_sets) {
        if (unit.is_keyframe && !(has_sps && has_pps)) {
            std::vector<uint8_t> sps, pps;
            if (parameter_sets(sps, pps)) {
                std::vector<uint8_t> rebuilt;
                rebuilt.reserve(unit.data.size() + sps.size() + pps.size() + 8);
                h264::append_annexb(rebuilt, sps.data(), sps.size());
                h264::append_annexb(rebuilt, pps.data(), pps.size());
                for (const auto& nal : nals) {
                    if (nal.type == h264::NAL_SPS || nal.type == h264::NAL_PPS) continue;
                    h264::append_annexb(rebuilt, unit.data.data() + nal.offset, nal.size);
                }
                unit.data.swap(rebuilt);
                has_sps = has_pps = true;
            }
        }
        unit.has_parameter_sets = has_sps && has_pps;
        return;
    }

    // Out of band: strip SPS/PPS from the stream
    if (has_sps || has_pps) {
        std::vector<uint8_t> rebuilt;
        rebuilt.reserve(unit.data.size());
        for (const auto& nal : nals) {
            if (nal.type == h264::NAL_SPS || nal.type == h264::NAL_PPS) continue;
            h264::append_annexb(rebuilt, unit.data.data() + nal.offset, nal.size);
        }
        unit.data.swap(rebuilt);
    }
    unit.has_parameter_sets = false;
}

void EncoderStage::cache_parameter_sets(const uint8_t* data, size_t size) {
    std::vector<h264::NalRef> nals = h264::split_annexb(data, size);

    std::lock_guard<std::mutex> lock(param_mutex_);
    for (const auto& nal : nals) {
        if (nal.type == h264::NAL_SPS) {
            sps_.assign(data + nal.offset, data + nal.offset + nal.size);
        } else if (nal.type == h264::NAL_PPS) {
            pps_.assign(data + nal.offset, data + nal.offset + nal.size);
        }
    }
}

bool EncoderStage::parameter_sets(std::vector<uint8_t>& sps, std::vector<uint8_t>& pps) const {
    std::lock_guard<std::mutex> lock(param_mutex_);
    if (sps_.empty() || pps_.empty()) {
        return false;
    }
    sps = sps_;
    pps = pps_;
    return true;
}
