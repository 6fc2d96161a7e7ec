/*
 * Stream table parsing: defaults, codec-dependent source defaults and
 * rejection of malformed entries.
 */

#include "test_util.h"
#include "../server/status.h"
#include "../server/config/stream_config.h"
#include <cstdio>
#include <string>
#include <unistd.h>

using json_utils::json;

// True if parsing `text` throws ConfigError
static bool rejects(const std::string& text) {
    try {
        config::parse_streams(json::parse(text));
    } catch (const ConfigError& e) {
        printf("  rejected: %s\n", e.what());
        return true;
    }
    return false;
}

static void test_minimal_stream() {
    config::StreamsConfig cfg = config::parse_streams(json::parse(R"({
        "streams": [
            {"path": "/cam", "media": [{"kind": "video", "codec": "h264"}]}
        ]
    })"));

    CHECK(!cfg.eager_start);
    CHECK_EQ(cfg.mtu, 1200);
    CHECK_EQ(cfg.queue_size, 512);
    CHECK_EQ(cfg.streams.size(), 1);

    const config::StreamConfig& s = cfg.streams[0];
    CHECK(s.path == "/cam");
    CHECK(s.shared);
    CHECK_EQ(s.media.size(), 1);

    const config::MediaConfig& m = s.media[0];
    CHECK(m.source.type == config::SourceType::Pattern);
    CHECK_EQ(m.source.width, 640);
    CHECK_EQ(m.source.height, 480);
    CHECK_EQ(m.source.fps_num, 30);
    CHECK_EQ(m.encoder.keyframe_interval, 30);
    CHECK(m.encoder.repeat_parameter_sets);
    CHECK_EQ(config::resolved_payload_type(m, 0), 96);
    CHECK_EQ(config::resolved_clock_rate(m), 90000);
}

static void test_full_stream() {
    config::StreamsConfig cfg = config::parse_streams(json::parse(R"({
        "eager_start": true,
        "mtu": 1400,
        "queue_size": 64,
        "streams": [{
            "path": "/av",
            "shared": false,
            "media": [
                {"kind": "video", "codec": "vp8", "payload_type": 100,
                 "source": {"pattern": "checkers-8", "width": 320, "height": 240, "fps": "30000/1001"},
                 "encoder": {"bitrate_kbps": 800, "keyframe_interval": 60}},
                {"kind": "audio", "codec": "opus",
                 "source": {"wave": "square", "frequency": 880, "channels": 2, "frame_ms": 10}},
                {"kind": "audio", "codec": "g722"},
                {"kind": "audio", "codec": "pcmu", "source": {"wave": "ticks"}}
            ]
        }]
    })"));

    CHECK(cfg.eager_start);
    CHECK_EQ(cfg.mtu, 1400);
    CHECK_EQ(cfg.queue_size, 64);

    const config::StreamConfig& s = cfg.streams[0];
    CHECK(!s.shared);
    CHECK_EQ(s.media.size(), 4);

    const config::MediaConfig& video = s.media[0];
    CHECK(video.codec == CodecType::VP8);
    CHECK(video.source.pattern == VideoPattern::Checkers8);
    CHECK_EQ(video.source.fps_num, 30000);
    CHECK_EQ(video.source.fps_den, 1001);
    CHECK_EQ(video.encoder.keyframe_interval, 60);
    CHECK_EQ(config::resolved_payload_type(video, 0), 100);

    // Opus defaults to 48 kHz input, G.722 to 16 kHz
    const config::MediaConfig& opus = s.media[1];
    CHECK_EQ(opus.source.sample_rate, 48000);
    CHECK_EQ(opus.source.channels, 2);
    CHECK_EQ(opus.encoder.bitrate_kbps, 64);
    CHECK_EQ(config::resolved_payload_type(opus, 1), 97);
    CHECK_EQ(config::resolved_clock_rate(opus), 48000);

    const config::MediaConfig& g722 = s.media[2];
    CHECK(g722.source.type == config::SourceType::Tone);
    CHECK_EQ(g722.source.sample_rate, 16000);
    CHECK_EQ(config::resolved_payload_type(g722, 2), 9);
    CHECK_EQ(config::resolved_clock_rate(g722), 8000);

    const config::MediaConfig& pcmu = s.media[3];
    CHECK(pcmu.source.wave == ToneWave::Ticks);
    CHECK_EQ(config::resolved_payload_type(pcmu, 3), 0);
    CHECK_EQ(config::resolved_clock_rate(pcmu), 8000);
}

static void test_rejections() {
    CHECK(rejects(R"({"streams": []})"));
    CHECK(rejects(R"({"streams": [{"path": "/a", "media": []}]})"));
    CHECK(rejects(R"({"streams": [{"media": [{"kind": "video", "codec": "h264"}]}]})"));
    CHECK(rejects(R"({"streams": [{"path": "/a", "media": [{"kind": "video", "codec": "mpeg2"}]}]})"));
    CHECK(rejects(R"({"streams": [{"path": "/a", "media": [{"kind": "audio", "codec": "h264"}]}]})"));
    CHECK(rejects(R"({"streams": [{"path": "/a", "media": [{"kind": "video", "codec": "h264",
                      "source": {"type": "tone"}}]}]})"));
    CHECK(rejects(R"({"streams": [{"path": "/a", "media": [{"kind": "video", "codec": "h264",
                      "source": {"pattern": "plaid"}}]}]})"));
    CHECK(rejects(R"({"streams": [{"path": "/a", "media": [{"kind": "video", "codec": "h264",
                      "source": {"width": "wide"}}]}]})"));
    CHECK(rejects(R"({"streams": [{"path": "/a", "media": [{"kind": "video", "codec": "h264",
                      "source": {"fps": "fast"}}]}]})"));
    CHECK(rejects(R"({"streams": [{"path": "/a", "media": [{"kind": "video", "codec": "h264",
                      "source": {"type": "file"}}]}]})"));
    CHECK(rejects(R"({"streams": [{"path": "/a", "media": [{"kind": "audio", "codec": "pcma",
                      "payload_type": 200}]}]})"));
    CHECK(rejects(R"({"streams": [{"path": "/a", "media": [{"kind": "audio", "codec": "pcma",
                      "source": {"volume": 2.0}}]}]})"));
    CHECK(rejects(R"({"mtu": 100, "streams": [{"path": "/a", "media": [{"kind": "audio", "codec": "pcma"}]}]})"));
    CHECK(rejects(R"({"streams": {"path": "/a"}})"));
    CHECK(rejects(R"([1, 2, 3])"));
}

static void test_load_file() {
    char path[] = "/tmp/testsrc_streams_XXXXXX";
    int fd = mkstemp(path);
    CHECK(fd >= 0);
    close(fd);

    // Save the defaults and read them back
    config::StreamsConfig defaults = config::default_streams();
    CHECK(config::save_streams(path, defaults));
    config::StreamsConfig loaded = config::load_streams(path);
    CHECK_EQ(loaded.streams.size(), defaults.streams.size());
    CHECK(loaded.streams[0].path == "/test");
    CHECK(loaded.streams[1].path == "/test2");
    CHECK(loaded.streams[0].media[1].codec == CodecType::PCMU);
    CHECK(loaded.streams[1].media[0].source.pattern == defaults.streams[1].media[0].source.pattern);

    // Truncated JSON is a configuration error, not a parser exception
    FILE* f = fopen(path, "w");
    CHECK(f != nullptr);
    if (f) {
        fputs("{\"streams\": [", f);
        fclose(f);
    }
    bool threw = false;
    try {
        config::load_streams(path);
    } catch (const ConfigError&) {
        threw = true;
    }
    CHECK(threw);
    unlink(path);

    threw = false;
    try {
        config::load_streams("/nonexistent/streams.json");
    } catch (const ConfigError&) {
        threw = true;
    }
    CHECK(threw);
}

int main() {
    RUN_TEST(test_minimal_stream);
    RUN_TEST(test_full_stream);
    RUN_TEST(test_rejections);
    RUN_TEST(test_load_file);
    return test_summary("test_stream_config");
}
