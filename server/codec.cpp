/*
 * Codec Definitions Implementation
 */

#include "codec.h"

const char* codec_name(CodecType codec) {
    switch (codec) {
        case CodecType::H264: return "h264";
        case CodecType::VP8:  return "vp8";
        case CodecType::OPUS: return "opus";
        case CodecType::PCMU: return "pcmu";
        case CodecType::PCMA: return "pcma";
        case CodecType::G722: return "g722";
    }
    return "unknown";
}

const char* codec_encoding_name(CodecType codec) {
    switch (codec) {
        case CodecType::H264: return "H264";
        case CodecType::VP8:  return "VP8";
        case CodecType::OPUS: return "opus";
        case CodecType::PCMU: return "PCMU";
        case CodecType::PCMA: return "PCMA";
        case CodecType::G722: return "G722";
    }
    return "unknown";
}

bool parse_codec(const std::string& name, CodecType& out) {
    if (name == "h264") { out = CodecType::H264; return true; }
    if (name == "vp8")  { out = CodecType::VP8;  return true; }
    if (name == "opus") { out = CodecType::OPUS; return true; }
    if (name == "pcmu") { out = CodecType::PCMU; return true; }
    if (name == "pcma") { out = CodecType::PCMA; return true; }
    if (name == "g722") { out = CodecType::G722; return true; }
    return false;
}

const char* media_kind_name(MediaKind kind) {
    return kind == MediaKind::Video ? "video" : "audio";
}

bool parse_media_kind(const std::string& name, MediaKind& out) {
    if (name == "video") { out = MediaKind::Video; return true; }
    if (name == "audio") { out = MediaKind::Audio; return true; }
    return false;
}

MediaKind codec_media_kind(CodecType codec) {
    switch (codec) {
        case CodecType::H264:
        case CodecType::VP8:
            return MediaKind::Video;
        default:
            return MediaKind::Audio;
    }
}

uint32_t codec_default_clock_rate(CodecType codec) {
    switch (codec) {
        case CodecType::H264:
        case CodecType::VP8:
            return 90000;
        case CodecType::OPUS:
            return 48000;  // RFC 7587: always 48 kHz regardless of input rate
        case CodecType::G722:
            return 8000;   // RFC 3551: 8000 even though sampled at 16 kHz
        case CodecType::PCMU:
        case CodecType::PCMA:
            return 0;
    }
    return 0;
}

int codec_static_payload_type(CodecType codec) {
    switch (codec) {
        case CodecType::PCMU: return 0;
        case CodecType::PCMA: return 8;
        case CodecType::G722: return 9;
        default: return -1;
    }
}

int codec_priority(CodecType codec) {
    switch (codec) {
        case CodecType::H264: return 2;
        case CodecType::VP8:  return 4;
        case CodecType::OPUS: return 1;
        case CodecType::PCMU: return 2;
        case CodecType::PCMA: return 3;
        case CodecType::G722: return 4;
    }
    return 100;
}
