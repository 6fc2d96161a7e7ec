/*
 * Frame source tests: synthetic patterns and tones are deterministic,
 * timestamps advance strictly, raw files end or loop as configured.
 */

#include "test_util.h"
#include "../server/file_source.h"
#include "../server/frame_source.h"
#include "../server/pattern_source.h"
#include "../server/tone_source.h"
#include "../server/config/stream_config.h"
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>

static void test_pattern_deterministic() {
    PatternSource a(VideoPattern::Ball, 64, 48, 30, 1, true);
    PatternSource b(VideoPattern::Ball, 64, 48, 30, 1, true);

    for (int i = 0; i < 5; i++) {
        Frame fa, fb;
        CHECK(a.next_frame(fa) == SourceStatus::Ok);
        CHECK(b.next_frame(fb) == SourceStatus::Ok);
        CHECK(fa.data == fb.data);
        CHECK_EQ(fa.pts, i);
        CHECK_EQ(fa.data.size(), 64 * 48 * 3 / 2);
        CHECK_EQ(fa.width, 64);
        CHECK_EQ(fa.height, 48);
    }
}

static void test_pattern_timebase() {
    PatternSource src(VideoPattern::SMPTE, 32, 32, 30000, 1001, false);
    Timebase tb = src.timebase();
    CHECK_EQ(tb.num, 1001);
    CHECK_EQ(tb.den, 30000);
    CHECK_EQ(src.frame_duration(), 1);

    Frame first, second;
    CHECK(src.next_frame(first) == SourceStatus::Ok);
    CHECK(src.next_frame(second) == SourceStatus::Ok);
    CHECK((first.flags & FRAME_FLAG_DISCONT) != 0);
    CHECK((second.flags & FRAME_FLAG_DISCONT) == 0);
    CHECK(second.pts > first.pts);
}

static void test_ball_moves() {
    PatternSource src(VideoPattern::Ball, 64, 48, 30, 1, false);
    Frame f0, f1;
    CHECK(src.next_frame(f0) == SourceStatus::Ok);
    CHECK(src.next_frame(f1) == SourceStatus::Ok);
    CHECK(f0.data != f1.data);
}

static void test_tone_frames() {
    ToneSource src(ToneWave::Sine, 440.0, 0.5, 8000, 1, 20);
    CHECK_EQ(src.frame_duration(), 160);
    CHECK_EQ(src.timebase().den, 8000);

    int64_t last_pts = -1;
    for (int i = 0; i < 10; i++) {
        Frame f;
        CHECK(src.next_frame(f) == SourceStatus::Ok);
        CHECK(f.pts > last_pts);
        CHECK_EQ(f.pts, i * 160);
        CHECK_EQ(f.samples, 160);
        CHECK_EQ(f.data.size(), 160 * sizeof(int16_t));
        last_pts = f.pts;
    }
}

static void test_tone_stereo_interleaved() {
    ToneSource src(ToneWave::Square, 1000.0, 1.0, 48000, 2, 10);
    Frame f;
    CHECK(src.next_frame(f) == SourceStatus::Ok);
    CHECK_EQ(f.samples, 480);
    CHECK_EQ(f.channels, 2);
    const int16_t* pcm = f.pcm();
    bool same = true;
    for (int i = 0; i < f.samples; i++) {
        if (pcm[2 * i] != pcm[2 * i + 1]) same = false;
    }
    CHECK(same);
}

static void test_tone_waves() {
    ToneGenerator silence(8000, 1);
    silence.set_wave(ToneWave::Silence);
    bool all_zero = true;
    for (int16_t s : silence.generate_samples(0, 400)) {
        if (s != 0) all_zero = false;
    }
    CHECK(all_zero);

    ToneGenerator sine(8000, 1);
    sine.set_wave(ToneWave::Sine);
    sine.set_volume(1.0);
    CHECK_EQ(sine.sample_at(0), 0);
    // 440 Hz repeats every second exactly
    CHECK_EQ(sine.sample_at(17), sine.sample_at(8000 + 17));

    // Ticks: beep in the first 100 ms of each second only
    ToneGenerator ticks(8000, 1);
    ticks.set_wave(ToneWave::Ticks);
    ticks.set_frequency(1000.0);
    bool beep = false;
    for (int n = 0; n < 800; n++) {
        if (ticks.sample_at(n) != 0) beep = true;
    }
    bool quiet = true;
    for (int n = 800; n < 8000; n++) {
        if (ticks.sample_at(n) != 0) quiet = false;
    }
    CHECK(beep);
    CHECK(quiet);

    ToneWave wave;
    CHECK(parse_tone_wave("white-noise", wave));
    CHECK(wave == ToneWave::WhiteNoise);
    CHECK(!parse_tone_wave("pink-noise", wave));
}

static std::string write_temp_file(size_t bytes) {
    char path[] = "/tmp/testsrc_frames_XXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) {
        return std::string();
    }
    std::vector<uint8_t> data(bytes);
    for (size_t i = 0; i < bytes; i++) {
        data[i] = static_cast<uint8_t>(i);
    }
    ssize_t n = write(fd, data.data(), data.size());
    close(fd);
    if (n != static_cast<ssize_t>(bytes)) {
        unlink(path);
        return std::string();
    }
    return path;
}

static void test_file_end_of_stream() {
    // Two 16x16 I420 frames
    const size_t frame_bytes = 16 * 16 * 3 / 2;
    std::string path = write_temp_file(frame_bytes * 2);
    CHECK(!path.empty());

    std::unique_ptr<RawFileSource> src = RawFileSource::video(path, 16, 16, 25, 1, false);
    CHECK(src->open());

    Frame f;
    CHECK(src->next_frame(f) == SourceStatus::Ok);
    CHECK_EQ(f.pts, 0);
    CHECK((f.flags & FRAME_FLAG_DISCONT) != 0);
    CHECK(src->next_frame(f) == SourceStatus::Ok);
    CHECK_EQ(f.pts, 1);
    CHECK(src->next_frame(f) == SourceStatus::EndOfStream);

    unlink(path.c_str());
}

static void test_file_loop() {
    const size_t frame_bytes = 16 * 16 * 3 / 2;
    std::string path = write_temp_file(frame_bytes * 2);
    CHECK(!path.empty());

    std::unique_ptr<RawFileSource> src = RawFileSource::video(path, 16, 16, 25, 1, true);
    CHECK(src->open());

    Frame first, f;
    CHECK(src->next_frame(first) == SourceStatus::Ok);
    CHECK(src->next_frame(f) == SourceStatus::Ok);
    CHECK((f.flags & FRAME_FLAG_DISCONT) == 0);

    // Wraps to the first frame with a discontinuity, pts keep rising
    CHECK(src->next_frame(f) == SourceStatus::Ok);
    CHECK_EQ(f.pts, 2);
    CHECK((f.flags & FRAME_FLAG_DISCONT) != 0);
    CHECK(f.data == first.data);

    unlink(path.c_str());
}

static void test_file_short_frame() {
    // One and a half audio frames of 8 kHz mono, 20 ms
    const size_t frame_bytes = 160 * sizeof(int16_t);
    std::string path = write_temp_file(frame_bytes + frame_bytes / 2);
    CHECK(!path.empty());

    std::unique_ptr<RawFileSource> src = RawFileSource::audio(path, 8000, 1, 20, false);
    Frame f;
    CHECK(src->next_frame(f) == SourceStatus::Ok);
    CHECK_EQ(f.samples, 160);
    CHECK(src->next_frame(f) == SourceStatus::Unavailable);
    CHECK(!src->last_error().empty());

    unlink(path.c_str());
}

static void test_file_missing() {
    std::unique_ptr<RawFileSource> src = RawFileSource::video("/nonexistent/clip.yuv", 16, 16, 25, 1, true);
    CHECK(!src->open());
    CHECK(!src->last_error().empty());
}

static void test_factory() {
    config::MediaConfig video;
    video.kind = MediaKind::Video;
    video.source.type = config::SourceType::Pattern;
    video.source.width = 32;
    video.source.height = 32;
    std::unique_ptr<FrameSource> v = create_frame_source(video);
    CHECK(v != nullptr);
    CHECK(v->kind() == MediaKind::Video);
    CHECK(v->name() == "pattern:smpte");

    config::MediaConfig audio;
    audio.kind = MediaKind::Audio;
    audio.codec = CodecType::PCMU;
    audio.source.type = config::SourceType::Tone;
    audio.source.wave = ToneWave::Ticks;
    std::unique_ptr<FrameSource> a = create_frame_source(audio);
    CHECK(a != nullptr);
    CHECK(a->kind() == MediaKind::Audio);
    CHECK(a->name() == "tone:ticks");
}

int main() {
    RUN_TEST(test_pattern_deterministic);
    RUN_TEST(test_pattern_timebase);
    RUN_TEST(test_ball_moves);
    RUN_TEST(test_tone_frames);
    RUN_TEST(test_tone_stereo_interleaved);
    RUN_TEST(test_tone_waves);
    RUN_TEST(test_file_end_of_stream);
    RUN_TEST(test_file_loop);
    RUN_TEST(test_file_short_frame);
    RUN_TEST(test_file_missing);
    RUN_TEST(test_factory);
    return test_summary("test_frame_source");
}
