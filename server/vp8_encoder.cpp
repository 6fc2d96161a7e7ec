/*
 * VP8 Encoder using libvpx
 */

#include "vp8_encoder.h"
#include "config/server_config.h"
#include <cstdio>
#include <cstring>

bool VP8Encoder::init(const EncoderParams& params) {
    cleanup();

    if (params.width <= 0 || params.height <= 0 || (params.width & 1) || (params.height & 1)) {
        last_error_ = "unsupported resolution " + std::to_string(params.width) + "x" +
                      std::to_string(params.height) + " (must be even)";
        return false;
    }

    vpx_codec_iface_t* interface = vpx_codec_vp8_cx();
    vpx_codec_err_t res = vpx_codec_enc_config_default(interface, &config_, 0);
    if (res != VPX_CODEC_OK) {
        last_error_ = std::string("failed to get default config: ") + vpx_codec_err_to_string(res);
        return false;
    }

    config_.g_w = params.width;
    config_.g_h = params.height;
    // One timebase tick per frame
    config_.g_timebase.num = static_cast<int>(params.fps_den);
    config_.g_timebase.den = static_cast<int>(params.fps_num);
    config_.g_threads = 1;

    config_.rc_end_usage = VPX_CBR;
    config_.rc_target_bitrate = params.bitrate_kbps;
    config_.rc_min_quantizer = 4;
    config_.rc_max_quantizer = 56;
    config_.rc_undershoot_pct = 100;
    config_.rc_overshoot_pct = 100;
    config_.rc_buf_sz = 1000;
    config_.rc_buf_initial_sz = 500;
    config_.rc_buf_optimal_sz = 600;
    config_.rc_dropframe_thresh = 0;  // One unit per frame

    // Low-latency settings
    config_.g_lag_in_frames = 0;
    config_.kf_mode = VPX_KF_DISABLED;  // Keyframes only when forced
    config_.g_error_resilient = VPX_ERROR_RESILIENT_DEFAULT;
    config_.g_pass = VPX_RC_ONE_PASS;
    config_.g_profile = 0;

    res = vpx_codec_enc_init(&encoder_, interface, &config_, 0);
    if (res != VPX_CODEC_OK) {
        last_error_ = std::string("failed to initialize encoder: ") + vpx_codec_err_to_string(res);
        return false;
    }

    vpx_codec_control(&encoder_, VP8E_SET_CPUUSED, 8);
    vpx_codec_control(&encoder_, VP8E_SET_STATIC_THRESHOLD, 1);

    width_ = params.width;
    height_ = params.height;
    frame_count_ = 0;
    initialized_ = true;

    if (server_config::g_debug_media) {
        fprintf(stderr, "VP8: Encoder initialized %dx%d @ %u/%u fps, %u kbps\n",
                width_, height_, params.fps_num, params.fps_den, config_.rc_target_bitrate);
    }
    return true;
}

void VP8Encoder::cleanup() {
    if (initialized_) {
        vpx_codec_destroy(&encoder_);
        initialized_ = false;
    }
    frame_count_ = 0;
}

bool VP8Encoder::encode(const Frame& frame, bool force_keyframe, std::vector<EncodedUnit>& out) {
    if (!initialized_) {
        last_error_ = "encoder not initialized";
        return false;
    }
    if (frame.width != width_ || frame.height != height_) {
        last_error_ = "frame size does not match encoder";
        return false;
    }

    const int y_size = width_ * height_;
    if (frame.data.size() < static_cast<size_t>(y_size) * 3 / 2) {
        last_error_ = "short I420 frame";
        return false;
    }

    uint8_t* base = const_cast<uint8_t*>(frame.data.data());

    vpx_image_t img;
    memset(&img, 0, sizeof(img));
    img.fmt = VPX_IMG_FMT_I420;
    img.w = width_;
    img.h = height_;
    img.d_w = width_;
    img.d_h = height_;
    img.x_chroma_shift = 1;
    img.y_chroma_shift = 1;
    img.bps = 12;

    img.planes[VPX_PLANE_Y] = base;
    img.planes[VPX_PLANE_U] = base + y_size;
    img.planes[VPX_PLANE_V] = base + y_size + y_size / 4;
    img.stride[VPX_PLANE_Y] = width_;
    img.stride[VPX_PLANE_U] = width_ / 2;
    img.stride[VPX_PLANE_V] = width_ / 2;

    vpx_enc_frame_flags_t flags = 0;
    if (force_keyframe) {
        flags |= VPX_EFLAG_FORCE_KF;
    }

    vpx_codec_err_t res = vpx_codec_encode(&encoder_, &img, static_cast<vpx_codec_pts_t>(frame.pts),
                                           1, flags, VPX_DL_REALTIME);
    if (res != VPX_CODEC_OK) {
        const char* detail = vpx_codec_error_detail(&encoder_);
        last_error_ = std::string("encode failed: ") + vpx_codec_err_to_string(res) +
                      (detail ? std::string(" (") + detail + ")" : std::string());
        return false;
    }

    frame_count_++;

    vpx_codec_iter_t iter = nullptr;
    const vpx_codec_cx_pkt_t* pkt;
    while ((pkt = vpx_codec_get_cx_data(&encoder_, &iter)) != nullptr) {
        if (pkt->kind != VPX_CODEC_CX_FRAME_PKT) {
            continue;
        }

        EncodedUnit unit;
        unit.pts = frame.pts;
        unit.timebase = frame.timebase;
        const uint8_t* data = static_cast<const uint8_t*>(pkt->data.frame.buf);
        unit.data.assign(data, data + pkt->data.frame.sz);
        unit.is_keyframe = (pkt->data.frame.flags & VPX_FRAME_IS_KEY) != 0;

        if (unit.is_keyframe && server_config::g_debug_media) {
            fprintf(stderr, "VP8: Keyframe %llu, size=%zu bytes (%.1f KB)\n",
                    (unsigned long long)frame_count_, unit.data.size(), unit.data.size() / 1024.0f);
        }
        out.push_back(std::move(unit));
    }

    return true;
}
