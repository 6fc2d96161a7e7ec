/*
 * Codec Definitions
 *
 * Codecs the server can encode and packetize:
 * - H.264 via OpenH264 (RTP packetization-mode 1)
 * - VP8 via libvpx
 * - Opus via libopus
 * - PCMU / PCMA (G.711) and G.722, encoded in-tree
 */

#ifndef CODEC_H
#define CODEC_H

#include <cstdint>
#include <string>

enum class MediaKind {
    Video,
    Audio
};

enum class CodecType {
    H264,
    VP8,
    OPUS,
    PCMU,
    PCMA,
    G722
};

// Lowercase codec name used in config files and signaling ("h264", "pcmu", ...)
const char* codec_name(CodecType codec);

// RTP encoding name used in rtpmap ("H264", "PCMU", "opus", ...)
const char* codec_encoding_name(CodecType codec);

// Parse a config-file codec name, returns false if unknown
bool parse_codec(const std::string& name, CodecType& out);

const char* media_kind_name(MediaKind kind);
bool parse_media_kind(const std::string& name, MediaKind& out);

MediaKind codec_media_kind(CodecType codec);

// RTP clock rate mandated by the payload format (0 = sample rate dependent)
uint32_t codec_default_clock_rate(CodecType codec);

// Static payload type from RFC 3551, or -1 for dynamic codecs
int codec_static_payload_type(CodecType codec);

// Selection priority when a transport can only carry one stream per kind
// (lower is better)
int codec_priority(CodecType codec);

#endif // CODEC_H
