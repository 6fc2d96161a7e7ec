/*
 * Stream Registry Implementation
 */

#include "stream_registry.h"
#include "audio_config.h"
#include "h264_nal.h"
#include "status.h"
#include <cctype>
#include <cstdio>
#include <set>

namespace {

bool valid_path(const std::string& path) {
    if (path.size() < 2 || path[0] != '/') {
        return false;
    }
    for (char c : path) {
        if (isspace(static_cast<unsigned char>(c)) || iscntrl(static_cast<unsigned char>(c)) ||
            c == '?' || c == '#') {
            return false;
        }
    }
    return true;
}

void fail(const std::string& path, size_t index, const std::string& why) {
    throw ConfigError(path + " media " + std::to_string(index) + ": " + why);
}

void validate_media(const std::string& path, size_t index,
                    const MediaDescriptor& desc, const config::MediaConfig& cfg) {
    const config::SourceConfig& src = cfg.source;

    if (codec_media_kind(desc.codec) != desc.kind) {
        fail(path, index, std::string(codec_name(desc.codec)) + " is not a " +
                          media_kind_name(desc.kind) + " codec");
    }
    if (desc.kind != cfg.kind || desc.codec != cfg.codec) {
        fail(path, index, "descriptor does not match its media config");
    }
    if ((src.type == config::SourceType::Pattern && desc.kind != MediaKind::Video) ||
        (src.type == config::SourceType::Tone && desc.kind != MediaKind::Audio)) {
        fail(path, index, std::string(config::source_type_name(src.type)) + " source cannot feed " +
                          media_kind_name(desc.kind) + " media");
    }

    // Payload type: static codecs may keep their static number, everything
    // else must be in the dynamic range
    if (desc.payload_type > 127) {
        fail(path, index, "payload type out of range");
    }
    const int static_pt = codec_static_payload_type(desc.codec);
    if (desc.payload_type < 96 && desc.payload_type != static_pt) {
        fail(path, index, "payload type " + std::to_string(desc.payload_type) + " is reserved for another codec");
    }

    // Clock rate mandated by the payload format
    const uint32_t mandated = codec_default_clock_rate(desc.codec);
    if (mandated > 0 && desc.clock_rate != mandated) {
        fail(path, index, std::string(codec_name(desc.codec)) + " requires clock rate " + std::to_string(mandated));
    }
    if (desc.clock_rate == 0) {
        fail(path, index, "clock rate must be positive");
    }

    if (desc.kind == MediaKind::Video) {
        if ((src.width & 1) || (src.height & 1)) {
            fail(path, index, "video dimensions must be even");
        }
        if (src.fps_num == 0 || src.fps_den == 0) {
            fail(path, index, "invalid frame rate");
        }
        return;
    }

    // Audio
    if ((src.sample_rate * src.frame_ms) % 1000 != 0) {
        fail(path, index, "frame_ms does not give a whole number of samples");
    }

    switch (desc.codec) {
        case CodecType::PCMU:
        case CodecType::PCMA:
            if (desc.clock_rate != static_cast<uint32_t>(src.sample_rate)) {
                fail(path, index, "G.711 clock rate must equal the sample rate");
            }
            if (desc.payload_type == static_pt && (src.sample_rate != 8000 || src.channels != 1)) {
                fail(path, index, "static payload type requires 8000 Hz mono");
            }
            break;

        case CodecType::G722:
            if (src.sample_rate != G722_SAMPLE_RATE || src.channels != 1) {
                fail(path, index, "G.722 requires a 16000 Hz mono source");
            }
            break;

        case CodecType::OPUS:
            if (src.sample_rate != 8000 && src.sample_rate != 12000 && src.sample_rate != 16000 &&
                src.sample_rate != 24000 && src.sample_rate != 48000) {
                fail(path, index, "Opus input must be 8, 12, 16, 24 or 48 kHz");
            }
            if (src.frame_ms != 5 && src.frame_ms != 10 && src.frame_ms != 20 &&
                src.frame_ms != 40 && src.frame_ms != 60) {
                fail(path, index, "Opus frame_ms must be 5, 10, 20, 40 or 60");
            }
            break;

        default:
            break;
    }
}

} // namespace

MediaDescriptor describe_media(const config::MediaConfig& media, size_t index) {
    MediaDescriptor desc;
    desc.kind = media.kind;
    desc.codec = media.codec;
    desc.clock_rate = config::resolved_clock_rate(media);
    desc.payload_type = static_cast<uint8_t>(config::resolved_payload_type(media, index));
    desc.channels = media.kind == MediaKind::Audio ? media.source.channels : 1;
    if (media.kind == MediaKind::Video) {
        desc.width = media.source.width;
        desc.height = media.source.height;
    }

    switch (media.codec) {
        case CodecType::H264:
            desc.params["packetization-mode"] = "1";
            desc.params["profile-level-id"] = h264::baseline_profile_level_id(
                h264::level_idc_for(media.source.width, media.source.height,
                                    media.source.fps_num, media.source.fps_den));
            desc.params["level-asymmetry-allowed"] = "1";
            break;
        case CodecType::OPUS:
            desc.params["minptime"] = "10";
            desc.params["useinbandfec"] = "1";
            if (media.source.channels == 2) {
                desc.params["stereo"] = "1";
                desc.params["sprop-stereo"] = "1";
            }
            break;
        default:
            break;
    }
    return desc;
}

const StreamEntry& StreamRegistry::register_stream(const std::string& path,
                                                   const std::vector<MediaDescriptor>& media,
                                                   const std::vector<config::MediaConfig>& media_config,
                                                   bool shared) {
    if (sealed_) {
        throw ConfigError("cannot register " + path + ": registry is sealed");
    }
    if (!valid_path(path)) {
        throw ConfigError("invalid mount path '" + path + "' (must start with '/')");
    }
    if (entries_.count(path)) {
        throw ConfigError("duplicate mount path " + path);
    }
    if (media.empty()) {
        throw ConfigError(path + ": stream has no media");
    }
    if (media.size() != media_config.size()) {
        throw ConfigError(path + ": descriptor/config count mismatch");
    }

    std::set<int> payload_types;
    for (size_t i = 0; i < media.size(); i++) {
        validate_media(path, i, media[i], media_config[i]);
        if (!payload_types.insert(media[i].payload_type).second) {
            fail(path, i, "duplicate payload type " + std::to_string(media[i].payload_type));
        }
    }

    StreamEntry entry;
    entry.path = path;
    entry.media = media;
    entry.media_config = media_config;
    entry.shared = shared;

    auto result = entries_.emplace(path, std::move(entry));
    return result.first->second;
}

const StreamEntry& StreamRegistry::register_stream(const config::StreamConfig& stream) {
    std::vector<MediaDescriptor> media;
    for (size_t i = 0; i < stream.media.size(); i++) {
        media.push_back(describe_media(stream.media[i], i));
    }
    return register_stream(stream.path, media, stream.media, stream.shared);
}

void StreamRegistry::load(const config::StreamsConfig& cfg) {
    for (const auto& stream : cfg.streams) {
        register_stream(stream);
    }
}

const StreamEntry* StreamRegistry::lookup(const std::string& path) const {
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> StreamRegistry::paths() const {
    std::vector<std::string> result;
    for (const auto& kv : entries_) {
        result.push_back(kv.first);
    }
    return result;
}

void StreamRegistry::print_table() const {
    fprintf(stderr, "Mounts:\n");
    for (const auto& kv : entries_) {
        const StreamEntry& entry = kv.second;
        fprintf(stderr, "  %-12s %s\n", entry.path.c_str(), entry.shared ? "(shared)" : "(per-session)");
        for (size_t i = 0; i < entry.media.size(); i++) {
            const MediaDescriptor& desc = entry.media[i];
            const config::SourceConfig& src = entry.media_config[i].source;
            if (desc.kind == MediaKind::Video) {
                const char* what = src.type == config::SourceType::File ? src.file_path.c_str()
                                                                        : video_pattern_name(src.pattern);
                fprintf(stderr, "    video pt=%-3u %-14s %s %dx%d @ %u/%u\n",
                        desc.payload_type, desc.rtpmap().c_str(), what,
                        src.width, src.height, src.fps_num, src.fps_den);
            } else {
                const char* what = src.type == config::SourceType::File ? src.file_path.c_str()
                                                                        : tone_wave_name(src.wave);
                fprintf(stderr, "    audio pt=%-3u %-14s %s %d Hz x%d\n",
                        desc.payload_type, desc.rtpmap().c_str(), what,
                        src.sample_rate, src.channels);
            }
        }
    }
}
