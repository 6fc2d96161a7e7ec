/*
 * Mount registry: registration rules, lookup and sealing.
 */

#include "test_util.h"
#include "../server/status.h"
#include "../server/stream_registry.h"

static config::MediaConfig h264_media() {
    config::MediaConfig m;
    m.kind = MediaKind::Video;
    m.codec = CodecType::H264;
    m.source.type = config::SourceType::Pattern;
    m.source.width = 320;
    m.source.height = 240;
    return m;
}

static config::MediaConfig audio_media(CodecType codec, int sample_rate, int channels) {
    config::MediaConfig m;
    m.kind = MediaKind::Audio;
    m.codec = codec;
    m.source.type = config::SourceType::Tone;
    m.source.sample_rate = sample_rate;
    m.source.channels = channels;
    return m;
}

static config::StreamConfig stream(const std::string& path, const std::vector<config::MediaConfig>& media) {
    config::StreamConfig s;
    s.path = path;
    s.media = media;
    return s;
}

// True if registering `s` in `registry` throws ConfigError
static bool rejects(StreamRegistry& registry, const config::StreamConfig& s) {
    try {
        registry.register_stream(s);
    } catch (const ConfigError& e) {
        printf("  rejected: %s\n", e.what());
        return true;
    }
    return false;
}

static bool rejects(const config::StreamConfig& s) {
    StreamRegistry registry;
    return rejects(registry, s);
}

static void test_register_and_lookup() {
    StreamRegistry registry;
    const StreamEntry& entry = registry.register_stream(
        stream("/test", {h264_media(), audio_media(CodecType::PCMU, 8000, 1)}));

    CHECK(entry.path == "/test");
    CHECK_EQ(entry.media.size(), 2);
    CHECK_EQ(entry.media_config.size(), 2);
    CHECK_EQ(entry.media[0].payload_type, 96);
    CHECK_EQ(entry.media[0].clock_rate, 90000);
    CHECK(entry.media[0].params.at("packetization-mode") == "1");
    CHECK_EQ(entry.media[1].payload_type, 0);
    CHECK_EQ(entry.media[1].clock_rate, 8000);

    const StreamEntry* found = registry.lookup("/test");
    CHECK(found == &entry);
    CHECK(registry.lookup("/bogus") == nullptr);
    CHECK(registry.lookup("/test/") == nullptr);
    CHECK_EQ(registry.size(), 1);
}

static void test_duplicate_path() {
    StreamRegistry registry;
    registry.register_stream(stream("/test", {h264_media()}));
    CHECK(rejects(registry, stream("/test", {h264_media()})));
    CHECK_EQ(registry.size(), 1);
}

static void test_malformed_paths() {
    CHECK(rejects(stream("", {h264_media()})));
    CHECK(rejects(stream("/", {h264_media()})));
    CHECK(rejects(stream("test", {h264_media()})));
    CHECK(rejects(stream("/te st", {h264_media()})));
    CHECK(rejects(stream("/test?x=1", {h264_media()})));
    CHECK(rejects(stream("/test#a", {h264_media()})));
    CHECK(!rejects(stream("/live/cam-1", {h264_media()})));
}

static void test_sealed() {
    StreamRegistry registry;
    registry.register_stream(stream("/a", {h264_media()}));
    registry.seal();
    CHECK(registry.sealed());
    CHECK(rejects(registry, stream("/b", {h264_media()})));
    CHECK(registry.lookup("/a") != nullptr);
    CHECK(registry.lookup("/b") == nullptr);
}

static void test_payload_types() {
    // Two dynamic codecs on the same explicit type
    config::MediaConfig video = h264_media();
    config::MediaConfig opus = audio_media(CodecType::OPUS, 48000, 2);
    video.payload_type = 100;
    opus.payload_type = 100;
    CHECK(rejects(stream("/dup", {video, opus})));

    // Static type of another codec
    config::MediaConfig pcma = audio_media(CodecType::PCMA, 8000, 1);
    pcma.payload_type = 0;
    CHECK(rejects(stream("/pt", {pcma})));

    // Two G.711 variants each on their static type
    CHECK(!rejects(stream("/g711", {audio_media(CodecType::PCMU, 8000, 1),
                                    audio_media(CodecType::PCMA, 8000, 1)})));

    // Dynamic type for a static codec is allowed
    config::MediaConfig wide = audio_media(CodecType::PCMU, 16000, 1);
    wide.payload_type = 110;
    CHECK(!rejects(stream("/wide", {wide})));
}

static void test_codec_constraints() {
    // Odd dimensions
    config::MediaConfig odd = h264_media();
    odd.source.width = 321;
    CHECK(rejects(stream("/odd", {odd})));

    // H.264 must run on the 90 kHz clock
    config::MediaConfig clock = h264_media();
    clock.clock_rate = 48000;
    CHECK(rejects(stream("/clock", {clock})));

    // G.722 needs 16 kHz mono input
    CHECK(rejects(stream("/g722", {audio_media(CodecType::G722, 8000, 1)})));
    CHECK(!rejects(stream("/g722", {audio_media(CodecType::G722, 16000, 1)})));

    // Static PCMU is 8 kHz mono
    CHECK(rejects(stream("/pcmu", {audio_media(CodecType::PCMU, 8000, 2)})));

    // Opus frame durations
    config::MediaConfig opus = audio_media(CodecType::OPUS, 48000, 1);
    opus.source.frame_ms = 30;
    CHECK(rejects(stream("/opus", {opus})));
    opus.source.frame_ms = 20;
    opus.source.sample_rate = 44100;
    CHECK(rejects(stream("/opus", {opus})));

    // Source kind must match media kind
    config::MediaConfig tone_video = h264_media();
    tone_video.source.type = config::SourceType::Tone;
    CHECK(rejects(stream("/mixed", {tone_video})));
}

static void test_descriptor_mismatch() {
    StreamRegistry registry;
    config::MediaConfig cfg = h264_media();
    MediaDescriptor desc = describe_media(cfg, 0);
    desc.codec = CodecType::VP8;

    bool threw = false;
    try {
        registry.register_stream("/x", {desc}, {cfg}, true);
    } catch (const ConfigError&) {
        threw = true;
    }
    CHECK(threw);

    threw = false;
    try {
        registry.register_stream("/y", {describe_media(cfg, 0)}, {}, true);
    } catch (const ConfigError&) {
        threw = true;
    }
    CHECK(threw);
}

static void test_opus_descriptor() {
    MediaDescriptor stereo = describe_media(audio_media(CodecType::OPUS, 48000, 2), 1);
    CHECK_EQ(stereo.payload_type, 97);
    CHECK_EQ(stereo.clock_rate, 48000);
    CHECK(stereo.rtpmap() == "opus/48000/2");
    CHECK(stereo.params.at("stereo") == "1");

    MediaDescriptor mono = describe_media(audio_media(CodecType::OPUS, 16000, 1), 0);
    CHECK_EQ(mono.clock_rate, 48000);
    CHECK(mono.params.count("stereo") == 0);
}

static void test_h264_descriptor_level() {
    config::MediaConfig small = h264_media();
    CHECK(describe_media(small, 0).params.at("profile-level-id") == "42e01f");

    config::MediaConfig full_hd = h264_media();
    full_hd.source.width = 1920;
    full_hd.source.height = 1080;
    full_hd.source.fps_num = 60;
    CHECK(describe_media(full_hd, 0).params.at("profile-level-id") == "42e02a");
}

static void test_select_larger_video() {
    config::MediaConfig h264 = h264_media();
    config::MediaConfig vp8 = h264_media();
    vp8.codec = CodecType::VP8;
    vp8.source.width = 640;
    vp8.source.height = 480;

    StreamRegistry registry;
    const StreamEntry& entry = registry.register_stream(
        stream("/multi", {h264, vp8, audio_media(CodecType::PCMA, 8000, 1)}));
    CHECK_EQ(entry.media[1].width, 640);
    CHECK_EQ(entry.media[1].height, 480);
    CHECK_EQ(entry.media[2].width, 0);

    std::vector<size_t> best = select_best_media(entry.media);
    CHECK_EQ(best.size(), 2);
    CHECK_EQ(best[0], 1);
    CHECK_EQ(best[1], 2);
}

static void test_load_defaults() {
    StreamRegistry registry;
    registry.load(config::default_streams());
    std::vector<std::string> paths = registry.paths();
    CHECK_EQ(paths.size(), 2);
    CHECK(registry.lookup("/test") != nullptr);
    CHECK(registry.lookup("/test2") != nullptr);
    CHECK(registry.lookup("/test")->shared);
}

int main() {
    RUN_TEST(test_register_and_lookup);
    RUN_TEST(test_duplicate_path);
    RUN_TEST(test_malformed_paths);
    RUN_TEST(test_sealed);
    RUN_TEST(test_payload_types);
    RUN_TEST(test_codec_constraints);
    RUN_TEST(test_descriptor_mismatch);
    RUN_TEST(test_opus_descriptor);
    RUN_TEST(test_h264_descriptor_level);
    RUN_TEST(test_select_larger_video);
    RUN_TEST(test_load_defaults);
    return test_summary("test_stream_registry");
}
