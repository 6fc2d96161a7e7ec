/*
 * Stream Configuration Implementation
 */

#include "stream_config.h"
#include "../status.h"
#include <cstdio>
#include <fstream>

namespace config {

namespace {

using json = json_utils::json;

std::string index_path(const std::string& where, const char* key, size_t i) {
    return where + (where.empty() ? "" : ".") + key + "[" + std::to_string(i) + "]";
}

void check_range(const std::string& where, const char* key, double value, double lo, double hi) {
    if (value < lo || value > hi) {
        char buf[160];
        snprintf(buf, sizeof(buf), "%s.%s: %g out of range [%g, %g]", where.c_str(), key, value, lo, hi);
        throw ConfigError(buf);
    }
}

// "fps": 30 or "fps": "30000/1001"
void read_fps(const json& j, const std::string& where, SourceConfig& src) {
    if (!json_utils::has_key(j, "fps")) return;

    const json& v = j["fps"];
    if (v.is_number_integer()) {
        int fps = v.get<int>();
        check_range(where, "fps", fps, 1, 240);
        src.fps_num = static_cast<uint32_t>(fps);
        src.fps_den = 1;
        return;
    }
    if (v.is_string()) {
        unsigned num = 0, den = 0;
        if (sscanf(v.get<std::string>().c_str(), "%u/%u", &num, &den) == 2 && num > 0 && den > 0 &&
            num / den <= 240) {
            src.fps_num = num;
            src.fps_den = den;
            return;
        }
    }
    throw ConfigError(where + ".fps: expected integer or \"num/den\"");
}

SourceConfig parse_source(const json& j, MediaKind kind, CodecType codec, const std::string& where) {
    SourceConfig src;

    // Audio sample rate defaults to what the codec wants
    if (codec == CodecType::OPUS) src.sample_rate = 48000;
    if (codec == CodecType::G722) src.sample_rate = 16000;

    std::string type = kind == MediaKind::Video ? "pattern" : "tone";
    json_utils::read_string(j, "type", where, type);
    if (type == "pattern") {
        src.type = SourceType::Pattern;
    } else if (type == "tone") {
        src.type = SourceType::Tone;
    } else if (type == "file") {
        src.type = SourceType::File;
    } else {
        throw ConfigError(where + ".type: unknown source type '" + type + "'");
    }

    if ((src.type == SourceType::Pattern && kind != MediaKind::Video) ||
        (src.type == SourceType::Tone && kind != MediaKind::Audio)) {
        throw ConfigError(where + ".type: " + type + " source cannot feed " +
                          media_kind_name(kind) + " media");
    }

    std::string name;
    if (json_utils::read_string(j, "pattern", where, name) && !parse_video_pattern(name, src.pattern)) {
        throw ConfigError(where + ".pattern: unknown pattern '" + name + "'");
    }
    if (json_utils::read_string(j, "wave", where, name) && !parse_tone_wave(name, src.wave)) {
        throw ConfigError(where + ".wave: unknown wave '" + name + "'");
    }

    json_utils::read_int(j, "width", where, src.width);
    json_utils::read_int(j, "height", where, src.height);
    read_fps(j, where, src);
    json_utils::read_bool(j, "overlay", where, src.overlay);
    check_range(where, "width", src.width, 16, 4096);
    check_range(where, "height", src.height, 16, 4096);

    json_utils::read_double(j, "frequency", where, src.frequency);
    json_utils::read_double(j, "volume", where, src.volume);
    json_utils::read_int(j, "sample_rate", where, src.sample_rate);
    json_utils::read_int(j, "channels", where, src.channels);
    json_utils::read_int(j, "frame_ms", where, src.frame_ms);
    check_range(where, "frequency", src.frequency, 0.0, 24000.0);
    check_range(where, "volume", src.volume, 0.0, 1.0);
    check_range(where, "sample_rate", src.sample_rate, 8000, 48000);
    check_range(where, "channels", src.channels, 1, 2);
    check_range(where, "frame_ms", src.frame_ms, 5, 120);

    json_utils::read_string(j, "path", where, src.file_path);
    json_utils::read_bool(j, "loop", where, src.loop);
    if (src.type == SourceType::File && src.file_path.empty()) {
        throw ConfigError(where + ".path: file source needs a path");
    }

    return src;
}

EncoderConfig parse_encoder(const json& j, MediaKind kind, const std::string& where) {
    EncoderConfig enc;
    if (kind == MediaKind::Audio) {
        enc.bitrate_kbps = 64;
    }

    json_utils::read_int(j, "bitrate_kbps", where, enc.bitrate_kbps);
    json_utils::read_int(j, "keyframe_interval", where, enc.keyframe_interval);
    json_utils::read_bool(j, "repeat_parameter_sets", where, enc.repeat_parameter_sets);
    json_utils::read_int(j, "complexity", where, enc.complexity);
    check_range(where, "bitrate_kbps", enc.bitrate_kbps, 6, 100000);
    check_range(where, "keyframe_interval", enc.keyframe_interval, 1, 100000);
    check_range(where, "complexity", enc.complexity, 0, 10);
    return enc;
}

MediaConfig parse_media(const json& j, const std::string& where) {
    MediaConfig media;

    std::string kind = json_utils::require_string(j, "kind", where);
    if (!parse_media_kind(kind, media.kind)) {
        throw ConfigError(where + ".kind: unknown media kind '" + kind + "'");
    }

    std::string codec = json_utils::require_string(j, "codec", where);
    if (!parse_codec(codec, media.codec)) {
        throw ConfigError(where + ".codec: unsupported codec '" + codec + "'");
    }
    if (codec_media_kind(media.codec) != media.kind) {
        throw ConfigError(where + ".codec: " + codec + " is not a " + kind + " codec");
    }

    if (json_utils::read_int(j, "payload_type", where, media.payload_type)) {
        check_range(where, "payload_type", media.payload_type, 0, 127);
    }
    json_utils::read_uint(j, "clock_rate", where, media.clock_rate);

    media.source = parse_source(json_utils::object_field(j, "source", where), media.kind,
                                media.codec, where + ".source");
    media.encoder = parse_encoder(json_utils::object_field(j, "encoder", where), media.kind,
                                  where + ".encoder");
    return media;
}

json source_to_json(const MediaConfig& media) {
    const SourceConfig& s = media.source;
    json j;
    j["type"] = source_type_name(s.type);
    if (media.kind == MediaKind::Video) {
        if (s.type == SourceType::Pattern) {
            j["pattern"] = video_pattern_name(s.pattern);
            j["overlay"] = s.overlay;
        }
        j["width"] = s.width;
        j["height"] = s.height;
        if (s.fps_den == 1) {
            j["fps"] = s.fps_num;
        } else {
            j["fps"] = std::to_string(s.fps_num) + "/" + std::to_string(s.fps_den);
        }
    } else {
        if (s.type == SourceType::Tone) {
            j["wave"] = tone_wave_name(s.wave);
            j["frequency"] = s.frequency;
            j["volume"] = s.volume;
        }
        j["sample_rate"] = s.sample_rate;
        j["channels"] = s.channels;
        j["frame_ms"] = s.frame_ms;
    }
    if (s.type == SourceType::File) {
        j["path"] = s.file_path;
        j["loop"] = s.loop;
    }
    return j;
}

MediaConfig video_media(VideoPattern pattern, int width, int height, uint32_t fps, int bitrate_kbps) {
    MediaConfig m;
    m.kind = MediaKind::Video;
    m.codec = CodecType::H264;
    m.payload_type = 96;
    m.source.type = SourceType::Pattern;
    m.source.pattern = pattern;
    m.source.width = width;
    m.source.height = height;
    m.source.fps_num = fps;
    m.source.fps_den = 1;
    m.encoder.bitrate_kbps = bitrate_kbps;
    m.encoder.keyframe_interval = 30;
    m.encoder.repeat_parameter_sets = true;
    return m;
}

MediaConfig audio_media(CodecType codec, ToneWave wave, double frequency) {
    MediaConfig m;
    m.kind = MediaKind::Audio;
    m.codec = codec;
    m.payload_type = codec_static_payload_type(codec);
    m.source.type = SourceType::Tone;
    m.source.wave = wave;
    m.source.frequency = frequency;
    m.source.sample_rate = 8000;
    m.source.channels = 1;
    m.encoder.bitrate_kbps = 64;
    return m;
}

} // namespace

const char* source_type_name(SourceType type) {
    switch (type) {
        case SourceType::Pattern: return "pattern";
        case SourceType::Tone: return "tone";
        case SourceType::File: return "file";
    }
    return "unknown";
}

StreamsConfig parse_streams(const json& j) {
    StreamsConfig cfg;

    json_utils::read_bool(j, "eager_start", "", cfg.eager_start);
    json_utils::read_int(j, "mtu", "", cfg.mtu);
    check_range("<root>", "mtu", cfg.mtu, 256, 65000);

    int queue_size = static_cast<int>(cfg.queue_size);
    json_utils::read_int(j, "queue_size", "", queue_size);
    check_range("<root>", "queue_size", queue_size, 1, 1 << 20);
    cfg.queue_size = static_cast<size_t>(queue_size);

    const json& streams = json_utils::array_field(j, "streams", "");
    if (streams.empty()) {
        throw ConfigError("streams: at least one stream is required");
    }

    for (size_t i = 0; i < streams.size(); i++) {
        std::string where = index_path("", "streams", i);
        const json& s = streams[i];

        StreamConfig stream;
        stream.path = json_utils::require_string(s, "path", where);
        json_utils::read_bool(s, "shared", where, stream.shared);

        const json& media = json_utils::array_field(s, "media", where);
        if (media.empty()) {
            throw ConfigError(where + ".media: stream needs at least one media entry");
        }
        for (size_t m = 0; m < media.size(); m++) {
            stream.media.push_back(parse_media(media[m], index_path(where, "media", m)));
        }

        cfg.streams.push_back(std::move(stream));
    }

    return cfg;
}

StreamsConfig load_streams(const std::string& path) {
    json j = json_utils::parse_file(path);
    StreamsConfig cfg = parse_streams(j);
    fprintf(stderr, "Config: Loaded %zu stream(s) from %s\n", cfg.streams.size(), path.c_str());
    return cfg;
}

json streams_to_json(const StreamsConfig& cfg) {
    json j;
    j["eager_start"] = cfg.eager_start;
    j["mtu"] = cfg.mtu;
    j["queue_size"] = cfg.queue_size;
    j["streams"] = json::array();

    for (const auto& stream : cfg.streams) {
        json s;
        s["path"] = stream.path;
        s["shared"] = stream.shared;
        s["media"] = json::array();
        for (const auto& media : stream.media) {
            json m;
            m["kind"] = media_kind_name(media.kind);
            m["codec"] = codec_name(media.codec);
            if (media.payload_type >= 0) m["payload_type"] = media.payload_type;
            if (media.clock_rate > 0) m["clock_rate"] = media.clock_rate;
            m["source"] = source_to_json(media);
            m["encoder"] = {
                {"bitrate_kbps", media.encoder.bitrate_kbps},
                {"keyframe_interval", media.encoder.keyframe_interval},
                {"repeat_parameter_sets", media.encoder.repeat_parameter_sets},
                {"complexity", media.encoder.complexity}
            };
            s["media"].push_back(m);
        }
        j["streams"].push_back(s);
    }
    return j;
}

bool save_streams(const std::string& path, const StreamsConfig& cfg) {
    std::ofstream file(path);
    if (!file) {
        fprintf(stderr, "Config: Failed to open %s for writing\n", path.c_str());
        return false;
    }

    file << json_utils::to_string(streams_to_json(cfg), 2);
    if (!file) {
        fprintf(stderr, "Config: Failed to write %s\n", path.c_str());
        return false;
    }

    fprintf(stderr, "Config: Saved to %s\n", path.c_str());
    return true;
}

StreamsConfig default_streams() {
    StreamsConfig cfg;

    StreamConfig test;
    test.path = "/test";
    test.shared = true;
    test.media.push_back(video_media(VideoPattern::Ball, 640, 480, 60, 2000));
    test.media.push_back(audio_media(CodecType::PCMU, ToneWave::Ticks, 440.0));
    cfg.streams.push_back(test);

    StreamConfig test2;
    test2.path = "/test2";
    test2.shared = true;
    test2.media.push_back(video_media(VideoPattern::SMPTE, 1280, 720, 30, 4000));
    test2.media.push_back(audio_media(CodecType::PCMA, ToneWave::Sine, 440.0));
    cfg.streams.push_back(test2);

    return cfg;
}

int resolved_payload_type(const MediaConfig& media, size_t index) {
    if (media.payload_type >= 0) return media.payload_type;
    int static_pt = codec_static_payload_type(media.codec);
    if (static_pt >= 0) return static_pt;
    return 96 + static_cast<int>(index);
}

uint32_t resolved_clock_rate(const MediaConfig& media) {
    if (media.clock_rate > 0) return media.clock_rate;
    uint32_t rate = codec_default_clock_rate(media.codec);
    if (rate > 0) return rate;
    return static_cast<uint32_t>(media.source.sample_rate);
}

} // namespace config
