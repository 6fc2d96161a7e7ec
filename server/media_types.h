/*
 * Media Data Model
 *
 * Types flowing through a pipeline:
 *   Frame (raw) -> EncodedUnit (codec output) -> Packet (RTP)
 *
 * Frames and units are moved between stages. Packet payloads are immutable
 * and shared, so fanning a packet out to many sessions copies only the header
 * fields.
 */

#ifndef MEDIA_TYPES_H
#define MEDIA_TYPES_H

#include "codec.h"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Rational seconds-per-tick
struct Timebase {
    uint32_t num = 1;
    uint32_t den = 1;
};

// Convert a tick count in `tb` to units of `rate` per second, rounding down.
// Computed from the absolute tick count so repeated calls never drift.
uint64_t rescale_ticks(uint64_t ticks, const Timebase& tb, uint64_t rate);

enum FrameFlags : uint32_t {
    FRAME_FLAG_NONE     = 0,
    FRAME_FLAG_KEYFRAME = 1u << 0,  // Request a keyframe for this frame
    FRAME_FLAG_DISCONT  = 1u << 1   // First frame after a source restart
};

struct Frame {
    MediaKind kind = MediaKind::Video;
    int64_t pts = 0;           // In `timebase` ticks, strictly increasing
    Timebase timebase;
    int64_t duration = 0;      // In `timebase` ticks
    uint32_t flags = FRAME_FLAG_NONE;
    std::vector<uint8_t> data; // I420 (video) or interleaved S16 (audio)

    // Video
    int width = 0;
    int height = 0;

    // Audio
    int sample_rate = 0;
    int channels = 0;
    int samples = 0;           // Samples per channel

    const int16_t* pcm() const { return reinterpret_cast<const int16_t*>(data.data()); }
};

struct EncodedUnit {
    int64_t pts = 0;
    Timebase timebase;
    std::vector<uint8_t> data;
    bool is_keyframe = false;
    bool has_parameter_sets = false;  // H.264: SPS/PPS present inline
};

struct Packet {
    uint16_t sequence = 0;
    uint32_t timestamp = 0;
    bool marker = false;
    uint8_t payload_type = 0;
    std::shared_ptr<const std::vector<uint8_t>> payload;

    size_t payload_size() const { return payload ? payload->size() : 0; }

    // RTP fixed header (RFC 3550, no CSRC/extension) followed by payload
    std::vector<uint8_t> serialize(uint32_t ssrc) const;
};

static const size_t RTP_HEADER_SIZE = 12;

struct MediaDescriptor {
    MediaKind kind = MediaKind::Video;
    CodecType codec = CodecType::H264;
    uint32_t clock_rate = 90000;
    uint8_t payload_type = 96;
    int channels = 1;
    int width = 0;                              // Video only
    int height = 0;
    std::map<std::string, std::string> params;  // fmtp parameters

    // "H264/90000", "opus/48000/2"
    std::string rtpmap() const;

    // "packetization-mode=1;profile-level-id=42e01f", empty if no params
    std::string fmtp() const;
};

// Best media of each kind (for transports that carry one stream per kind),
// in stream order. Video: largest frame area first, then codec priority.
// Audio: codec priority.
std::vector<size_t> select_best_media(const std::vector<MediaDescriptor>& media);

#endif // MEDIA_TYPES_H
