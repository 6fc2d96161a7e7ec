/*
 * H.264 Encoder using OpenH264
 */

#include "h264_encoder.h"
#include "h264_nal.h"
#include "config/server_config.h"
#include <cstdio>

bool H264Encoder::init(const EncoderParams& params) {
    cleanup();

    if (params.width <= 0 || params.height <= 0 || (params.width & 1) || (params.height & 1)) {
        last_error_ = "unsupported resolution " + std::to_string(params.width) + "x" +
                      std::to_string(params.height) + " (must be even)";
        return false;
    }

    if (WelsCreateSVCEncoder(&encoder_) != 0 || !encoder_) {
        last_error_ = "failed to create OpenH264 encoder";
        encoder_ = nullptr;
        return false;
    }

    const float fps = static_cast<float>(params.fps_num) / static_cast<float>(params.fps_den);
    const int bitrate = params.bitrate_kbps * 1000;

    SEncParamExt param;
    encoder_->GetDefaultParams(&param);

    param.iUsageType = CAMERA_VIDEO_REAL_TIME;
    param.fMaxFrameRate = fps;
    param.iPicWidth = params.width;
    param.iPicHeight = params.height;
    param.iTargetBitrate = bitrate;
    param.iMaxBitrate = bitrate * 3 / 2;
    param.iRCMode = RC_BITRATE_MODE;
    param.bEnableFrameSkip = false;  // One unit per frame
    param.bEnableDenoise = false;
    param.bEnableSceneChangeDetect = false;
    param.iSpatialLayerNum = 1;
    param.iTemporalLayerNum = 1;
    param.iMultipleThreadIdc = 1;
    param.uiIntraPeriod = 0;  // IDRs only when forced
    param.eSpsPpsIdStrategy = CONSTANT_ID;  // SPS/PPS emitted with every IDR

    param.iLoopFilterDisableIdc = 0;
    param.iLoopFilterAlphaC0Offset = 0;
    param.iLoopFilterBetaOffset = 0;

    param.sSpatialLayers[0].iVideoWidth = params.width;
    param.sSpatialLayers[0].iVideoHeight = params.height;
    param.sSpatialLayers[0].fFrameRate = fps;
    param.sSpatialLayers[0].iSpatialBitrate = bitrate;
    param.sSpatialLayers[0].iMaxSpatialBitrate = bitrate * 3 / 2;
    param.sSpatialLayers[0].sSliceArgument.uiSliceMode = SM_SINGLE_SLICE;
    // Same level the stream description advertises
    param.sSpatialLayers[0].uiProfileIdc = PRO_BASELINE;
    param.sSpatialLayers[0].uiLevelIdc = static_cast<ELevelIdc>(
        h264::level_idc_for(params.width, params.height, params.fps_num, params.fps_den));

    int rv = encoder_->InitializeExt(&param);
    if (rv != 0) {
        last_error_ = "OpenH264 InitializeExt failed (" + std::to_string(rv) + ")";
        cleanup();
        return false;
    }

    int videoFormat = videoFormatI420;
    encoder_->SetOption(ENCODER_OPTION_DATAFORMAT, &videoFormat);

    width_ = params.width;
    height_ = params.height;
    frame_count_ = 0;
    idr_count_ = 0;

    if (server_config::g_debug_media) {
        fprintf(stderr, "H264: Encoder initialized %dx%d @ %.2f fps, %d kbps\n",
                width_, height_, fps, params.bitrate_kbps);
    }
    return true;
}

void H264Encoder::cleanup() {
    if (encoder_) {
        encoder_->Uninitialize();
        WelsDestroySVCEncoder(encoder_);
        encoder_ = nullptr;
    }
}

bool H264Encoder::encode(const Frame& frame, bool force_keyframe, std::vector<EncodedUnit>& out) {
    if (!encoder_) {
        last_error_ = "encoder not initialized";
        return false;
    }
    if (frame.width != width_ || frame.height != height_) {
        last_error_ = "frame size " + std::to_string(frame.width) + "x" + std::to_string(frame.height) +
                      " does not match encoder";
        return false;
    }

    const int y_size = width_ * height_;
    if (frame.data.size() < static_cast<size_t>(y_size) * 3 / 2) {
        last_error_ = "short I420 frame";
        return false;
    }

    if (force_keyframe) {
        encoder_->ForceIntraFrame(true);
    }

    const int uv_stride = width_ / 2;
    uint8_t* base = const_cast<uint8_t*>(frame.data.data());

    SSourcePicture pic = {};
    pic.iPicWidth = width_;
    pic.iPicHeight = height_;
    pic.iColorFormat = videoFormatI420;
    pic.iStride[0] = width_;
    pic.iStride[1] = uv_stride;
    pic.iStride[2] = uv_stride;
    pic.pData[0] = base;
    pic.pData[1] = base + y_size;
    pic.pData[2] = base + y_size + y_size / 4;

    SFrameBSInfo info = {};
    int rv = encoder_->EncodeFrame(&pic, &info);
    if (rv != 0) {
        last_error_ = "EncodeFrame returned " + std::to_string(rv);
        return false;
    }

    frame_count_++;

    if (info.eFrameType == videoFrameTypeSkip || info.eFrameType == videoFrameTypeInvalid) {
        return true;
    }

    EncodedUnit unit;
    unit.pts = frame.pts;
    unit.timebase = frame.timebase;
    unit.is_keyframe = (info.eFrameType == videoFrameTypeIDR);

    // Collect all NAL units with start codes
    for (int layer = 0; layer < info.iLayerNum; layer++) {
        const SLayerBSInfo& layerInfo = info.sLayerInfo[layer];
        const uint8_t* buf = layerInfo.pBsBuf;
        for (int nal = 0; nal < layerInfo.iNalCount; nal++) {
            int nalSize = layerInfo.pNalLengthInByte[nal];
            unit.data.insert(unit.data.end(), buf, buf + nalSize);
            buf += nalSize;
        }
    }

    if (unit.is_keyframe) {
        idr_count_++;
        if (server_config::g_debug_media) {
            fprintf(stderr, "H264: IDR frame %llu, size=%zu bytes (%.1f KB)\n",
                    (unsigned long long)frame_count_, unit.data.size(), unit.data.size() / 1024.0f);
        }
    }

    if (server_config::g_debug_perf && frame_count_ % 300 == 0) {
        fprintf(stderr, "H264: Frame stats - total=%llu IDR=%llu\n",
                (unsigned long long)frame_count_, (unsigned long long)idr_count_);
    }

    out.push_back(std::move(unit));
    return true;
}

bool H264Encoder::decoder_config(std::vector<uint8_t>& out) {
    if (!encoder_) {
        return false;
    }

    SFrameBSInfo info = {};
    int rv = encoder_->EncodeParameterSets(&info);
    if (rv != 0) {
        last_error_ = "EncodeParameterSets returned " + std::to_string(rv);
        return false;
    }

    for (int layer = 0; layer < info.iLayerNum; layer++) {
        const SLayerBSInfo& layerInfo = info.sLayerInfo[layer];
        const uint8_t* buf = layerInfo.pBsBuf;
        for (int nal = 0; nal < layerInfo.iNalCount; nal++) {
            int nalSize = layerInfo.pNalLengthInByte[nal];
            out.insert(out.end(), buf, buf + nalSize);
            buf += nalSize;
        }
    }
    return !out.empty();
}
