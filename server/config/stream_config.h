/*
 * Stream Configuration
 *
 * Typed description of the mount table, loaded from a JSON file or built
 * from the defaults. Every field is validated while loading; problems are
 * raised as ConfigError naming the JSON location.
 *
 * File layout:
 *   {
 *     "eager_start": false,
 *     "mtu": 1200,
 *     "queue_size": 512,
 *     "streams": [
 *       { "path": "/test", "shared": true,
 *         "media": [
 *           { "kind": "video", "codec": "h264", "payload_type": 96,
 *             "source":  { "type": "pattern", "pattern": "ball",
 *                          "width": 640, "height": 480, "fps": 60 },
 *             "encoder": { "bitrate_kbps": 2000, "keyframe_interval": 30,
 *                          "repeat_parameter_sets": true } },
 *           { "kind": "audio", "codec": "pcmu", "payload_type": 0,
 *             "source":  { "type": "tone", "wave": "ticks", "sample_rate": 8000 } }
 *         ] }
 *     ]
 *   }
 */

#ifndef STREAM_CONFIG_H
#define STREAM_CONFIG_H

#include "../codec.h"
#include "../pattern_source.h"
#include "../tone_generator.h"
#include "../utils/json_utils.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace config {

enum class SourceType {
    Pattern,
    Tone,
    File
};

const char* source_type_name(SourceType type);

struct SourceConfig {
    SourceType type = SourceType::Pattern;

    // Video (pattern, file)
    VideoPattern pattern = VideoPattern::SMPTE;
    int width = 640;
    int height = 480;
    uint32_t fps_num = 30;
    uint32_t fps_den = 1;
    bool overlay = false;           // Frame counter overlay

    // Audio (tone, file)
    ToneWave wave = ToneWave::Sine;
    double frequency = 440.0;
    double volume = 0.8;
    int sample_rate = 8000;
    int channels = 1;
    int frame_ms = 20;

    // File
    std::string file_path;
    bool loop = true;
};

struct EncoderConfig {
    int bitrate_kbps = 2000;        // Advisory target
    int keyframe_interval = 30;     // Frames between forced keyframes
    bool repeat_parameter_sets = true;  // H.264: SPS/PPS inline on every keyframe
    int complexity = 5;             // Opus complexity 0-10
};

struct MediaConfig {
    MediaKind kind = MediaKind::Video;
    CodecType codec = CodecType::H264;
    int payload_type = -1;          // -1 = static type, or 96 + media index
    uint32_t clock_rate = 0;        // 0 = codec default
    SourceConfig source;
    EncoderConfig encoder;
};

struct StreamConfig {
    std::string path;
    bool shared = true;
    std::vector<MediaConfig> media;
};

struct StreamsConfig {
    bool eager_start = false;
    int mtu = 1200;                 // Max RTP packet size including header
    size_t queue_size = 512;        // Per-session packet queue bound
    std::vector<StreamConfig> streams;
};

/**
 * Load the mount table from a JSON file
 * @param path Path to the stream file
 * @throws ConfigError on read, parse or validation error
 */
StreamsConfig load_streams(const std::string& path);

/**
 * Build the mount table from parsed JSON
 * @throws ConfigError on validation error
 */
StreamsConfig parse_streams(const json_utils::json& j);

/**
 * Serialize a mount table back to JSON (same layout as load_streams reads)
 */
json_utils::json streams_to_json(const StreamsConfig& cfg);

/**
 * Save a mount table to a JSON file
 * @return true if successful
 */
bool save_streams(const std::string& path, const StreamsConfig& cfg);

/**
 * Built-in mounts: /test and /test2
 */
StreamsConfig default_streams();

/**
 * Payload type actually used for a media entry (resolves -1)
 */
int resolved_payload_type(const MediaConfig& media, size_t index);

/**
 * RTP clock rate actually used for a media entry (resolves 0)
 */
uint32_t resolved_clock_rate(const MediaConfig& media);

} // namespace config

#endif // STREAM_CONFIG_H
