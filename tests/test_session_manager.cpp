/*
 * Session manager tests on simulated time: state machine, per-session
 * rewriting, queue overflow, teardown and pipeline lifetime.
 */

#include "test_util.h"
#include "recording_transport.h"
#include "../server/session_manager.h"
#include <cstdio>
#include <unistd.h>

static const int64_t START_US = 1000000;
static const int64_t FRAME_US = 20000;   // 20 ms audio frames

static config::MediaConfig pcmu_tone() {
    config::MediaConfig m;
    m.kind = MediaKind::Audio;
    m.codec = CodecType::PCMU;
    m.source.type = config::SourceType::Tone;
    m.source.wave = ToneWave::Sine;
    m.source.sample_rate = 8000;
    m.source.channels = 1;
    m.source.frame_ms = 20;
    return m;
}

static config::MediaConfig pcmu_file(const std::string& path) {
    config::MediaConfig m = pcmu_tone();
    m.source.type = config::SourceType::File;
    m.source.file_path = path;
    m.source.loop = false;
    return m;
}

static config::StreamConfig stream(const std::string& path, const config::MediaConfig& media, bool shared) {
    config::StreamConfig s;
    s.path = path;
    s.shared = shared;
    s.media.push_back(media);
    return s;
}

struct Fixture {
    ManualClock clock;
    DispatchLoop loop;
    StreamRegistry registry;
    SessionManager sessions;

    explicit Fixture(const SessionManagerOptions& options = SessionManagerOptions())
        : clock(START_US)
        , loop(&clock)
        , sessions(registry, loop, options)
    {
        CHECK(loop.init());
        registry.register_stream(stream("/tone", pcmu_tone(), true));
        registry.register_stream(stream("/private", pcmu_tone(), false));
    }

    // Run simulated time forward by `us`, firing everything due before the end
    void advance(int64_t us) { loop.run_until(clock.now_us() + us - 1); clock.set(clock.now_us() + 1); }

    // Run posted follow-ups (closure confirmations, reaps)
    void settle() {
        for (int i = 0; i < 4; i++) {
            loop.run_pending();
        }
    }

    SessionInfo info(SessionId id) {
        SessionInfo out;
        CHECK(sessions.session_info(id, out));
        return out;
    }
};

static bool contiguous(const std::vector<SentPacket>& packets, uint32_t ts_step) {
    for (size_t i = 1; i < packets.size(); i++) {
        if (packets[i].packet.sequence != static_cast<uint16_t>(packets[i - 1].packet.sequence + 1)) return false;
        if (packets[i].packet.timestamp - packets[i - 1].packet.timestamp != ts_step) return false;
    }
    return true;
}

static void test_state_machine() {
    Fixture f;
    RecordingTransport t(f.loop, f.sessions);
    SessionId id = f.sessions.open_session(&t);
    CHECK(f.info(id).state == SessionState::Init);

    CHECK(f.sessions.on_play(id).code == ErrorCode::InvalidState);
    CHECK(f.sessions.on_pause(id).code == ErrorCode::InvalidState);
    CHECK(f.sessions.on_setup(id, "/bogus").code == ErrorCode::NotFound);
    CHECK(f.sessions.on_setup(id, "/tone", {3}).code == ErrorCode::NotFound);
    CHECK(f.info(id).state == SessionState::Init);

    CHECK(f.sessions.on_setup(id, "/tone").is_ok());
    CHECK(f.info(id).state == SessionState::Ready);
    CHECK(f.info(id).path == "/tone");
    CHECK(f.sessions.on_setup(id, "/tone").code == ErrorCode::InvalidState);

    CHECK(f.sessions.on_play(id).is_ok());
    CHECK(f.info(id).state == SessionState::Playing);
    CHECK(f.sessions.on_play(id).is_ok());

    CHECK(f.sessions.on_pause(id).is_ok());
    CHECK(f.info(id).state == SessionState::Ready);
    CHECK(f.sessions.on_pause(id).is_ok());

    CHECK(f.sessions.on_teardown(id).is_ok());
    CHECK(f.sessions.on_teardown(id).is_ok());
    f.settle();
    CHECK(f.sessions.on_play(id).code == ErrorCode::NotFound);

    CHECK(f.sessions.on_setup(999, "/tone").code == ErrorCode::NotFound);
    CHECK(f.sessions.on_teardown(999).code == ErrorCode::NotFound);
}

static void test_torn_down_rejects_verbs() {
    Fixture f;
    RecordingTransport t(f.loop, f.sessions, false);
    SessionId id = f.sessions.open_session(&t);
    CHECK(f.sessions.on_setup(id, "/tone").is_ok());
    CHECK(f.sessions.on_teardown(id).is_ok());

    SessionInfo info = f.info(id);
    CHECK(info.state == SessionState::TornDown);
    CHECK(info.teardown_reason == ErrorCode::Ok);
    CHECK(f.sessions.on_play(id).code == ErrorCode::InvalidState);
    CHECK(f.sessions.on_setup(id, "/tone").code == ErrorCode::InvalidState);
    CHECK(f.sessions.on_teardown(id).is_ok());
    CHECK_EQ(t.closed().size(), 1);
}

static void test_describe() {
    Fixture f;
    std::vector<MediaDescriptor> media;
    CHECK(f.sessions.describe("/tone", media).is_ok());
    CHECK_EQ(media.size(), 1);
    CHECK(media[0].codec == CodecType::PCMU);
    CHECK(f.sessions.describe("/bogus", media).code == ErrorCode::NotFound);
}

static void test_delivery_only_when_playing() {
    Fixture f;
    RecordingTransport t(f.loop, f.sessions);
    SessionId a = f.sessions.open_session(&t);
    SessionId b = f.sessions.open_session(&t);

    CHECK(f.sessions.on_setup(a, "/tone").is_ok());
    CHECK(f.sessions.on_setup(b, "/tone").is_ok());
    CHECK_EQ(f.sessions.pipeline_count(), 1);
    CHECK(f.sessions.on_play(a).is_ok());

    f.advance(10 * FRAME_US);

    const std::vector<SentPacket>& sent = t.sent(a);
    CHECK_EQ(sent.size(), 10);
    CHECK(t.sent(b).empty());
    CHECK(contiguous(sent, 160));

    SessionInfo info = f.info(a);
    for (const auto& p : sent) {
        CHECK_EQ(p.ssrc, info.ssrc[0]);
        CHECK_EQ(p.packet.payload_type, 0);
        CHECK(p.packet.marker);
    }
    CHECK_EQ(info.stats.packets_sent, 10);
    CHECK_EQ(info.stats.bytes_sent, 10 * (RTP_HEADER_SIZE + 160));
}

static void test_late_joiner_rewrite() {
    Fixture f;
    RecordingTransport t(f.loop, f.sessions);
    SessionId a = f.sessions.open_session(&t);
    SessionId b = f.sessions.open_session(&t);
    CHECK(f.sessions.on_setup(a, "/tone").is_ok());
    CHECK(f.sessions.on_setup(b, "/tone").is_ok());
    CHECK(f.sessions.on_play(a).is_ok());

    f.advance(10 * FRAME_US);
    CHECK(f.sessions.on_play(b).is_ok());
    f.advance(10 * FRAME_US);

    std::vector<SentPacket> pa = t.sent(a);
    std::vector<SentPacket> pb = t.sent(b);
    CHECK_EQ(pa.size(), 20);
    CHECK_EQ(pb.size(), 10);
    CHECK(contiguous(pa, 160));
    CHECK(contiguous(pb, 160));

    // Same payload, each session on its own numbering
    CHECK(pa[10].packet.payload == pb[0].packet.payload);
    CHECK(f.info(a).ssrc[0] != f.info(b).ssrc[0]);
    CHECK_EQ(f.sessions.shared_pipeline("/tone")->stats(0).frames, 20);
}

static void test_queue_drops_oldest() {
    SessionManagerOptions options;
    options.queue_size = 4;
    Fixture f(options);
    RecordingTransport t(f.loop, f.sessions);
    SessionId id = f.sessions.open_session(&t);
    CHECK(f.sessions.on_setup(id, "/tone").is_ok());
    CHECK(f.sessions.on_play(id).is_ok());

    t.set_result(SendResult::WouldBlock);
    f.advance(10 * FRAME_US);

    SessionInfo info = f.info(id);
    CHECK_EQ(info.queued, 4);
    CHECK_EQ(info.stats.packets_dropped, 6);
    CHECK_EQ(info.stats.would_block, 1);
    CHECK(info.state == SessionState::Playing);

    t.set_result(SendResult::Sent);
    f.sessions.on_transport_writable(id);
    CHECK_EQ(t.sent(id).size(), 4);
    CHECK_EQ(f.info(id).queued, 0);

    // The newest packets survived: the next one follows on directly
    f.advance(FRAME_US);
    CHECK_EQ(t.sent(id).size(), 5);
    CHECK(contiguous(t.sent(id), 160));
}

static void test_shared_pause_resume() {
    Fixture f;
    RecordingTransport t(f.loop, f.sessions);
    SessionId id = f.sessions.open_session(&t);
    CHECK(f.sessions.on_setup(id, "/tone").is_ok());
    CHECK(f.sessions.on_play(id).is_ok());
    f.advance(5 * FRAME_US);
    CHECK_EQ(t.sent(id).size(), 5);

    CHECK(f.sessions.on_pause(id).is_ok());
    f.advance(5 * FRAME_US);
    CHECK_EQ(t.sent(id).size(), 5);

    // Shared pipeline keeps running for others
    CHECK_EQ(f.sessions.shared_pipeline("/tone")->stats(0).frames, 10);

    CHECK(f.sessions.on_play(id).is_ok());
    f.advance(5 * FRAME_US);
    std::vector<SentPacket> sent = t.sent(id);
    CHECK_EQ(sent.size(), 10);
    // Sequence stays gapless for the session across the pause
    CHECK_EQ(sent[5].packet.sequence, static_cast<uint16_t>(sent[4].packet.sequence + 1));
}

static void test_private_pipeline_pause() {
    Fixture f;
    RecordingTransport t(f.loop, f.sessions);
    SessionId a = f.sessions.open_session(&t);
    SessionId b = f.sessions.open_session(&t);
    CHECK(f.sessions.on_setup(a, "/private").is_ok());
    CHECK(f.sessions.on_setup(b, "/private").is_ok());
    CHECK_EQ(f.sessions.pipeline_count(), 2);
    CHECK(f.sessions.shared_pipeline("/private") == nullptr);

    // Nothing runs before play
    f.advance(5 * FRAME_US);
    CHECK(t.sent(a).empty());

    CHECK(f.sessions.on_play(a).is_ok());
    f.advance(5 * FRAME_US);
    CHECK_EQ(t.sent(a).size(), 5);
    CHECK(t.sent(b).empty());

    CHECK(f.sessions.on_pause(a).is_ok());
    f.advance(5 * FRAME_US);
    CHECK_EQ(t.sent(a).size(), 5);

    // The media timeline resumes where it stopped
    CHECK(f.sessions.on_play(a).is_ok());
    f.advance(5 * FRAME_US);
    CHECK_EQ(t.sent(a).size(), 10);
    CHECK(contiguous(t.sent(a), 160));
}

static void test_send_failure_tears_down() {
    Fixture f;
    RecordingTransport t(f.loop, f.sessions);
    SessionId id = f.sessions.open_session(&t);
    CHECK(f.sessions.on_setup(id, "/tone").is_ok());
    CHECK(f.sessions.on_play(id).is_ok());

    t.set_result(SendResult::Failed);
    f.advance(FRAME_US);

    CHECK_EQ(t.closed().size(), 1);
    CHECK_EQ(t.closed()[0], id);
    f.settle();
    CHECK_EQ(f.sessions.session_count(), 0);
    CHECK(f.sessions.shared_pipeline("/tone") == nullptr);
    CHECK_EQ(f.sessions.pipeline_count(), 0);
}

static void test_transport_failure_reason() {
    Fixture f;
    RecordingTransport t(f.loop, f.sessions, false);
    SessionId id = f.sessions.open_session(&t);
    CHECK(f.sessions.on_setup(id, "/tone").is_ok());
    CHECK(f.sessions.on_play(id).is_ok());

    f.sessions.on_transport_failure(id, "peer vanished");
    SessionInfo info = f.info(id);
    CHECK(info.state == SessionState::TornDown);
    CHECK(info.teardown_reason == ErrorCode::TransportFailure);
    CHECK(info.teardown_message == "peer vanished");
}

static void test_teardown_timeout() {
    Fixture f;
    RecordingTransport t(f.loop, f.sessions, false);
    SessionId id = f.sessions.open_session(&t);
    CHECK(f.sessions.on_setup(id, "/tone").is_ok());
    CHECK(f.sessions.on_play(id).is_ok());
    f.advance(FRAME_US);

    CHECK(f.sessions.on_teardown(id).is_ok());
    CHECK_EQ(t.closed().size(), 1);

    // No delivery after teardown while the transport closes
    size_t before = t.sent(id).size();
    f.advance(1000000);
    CHECK_EQ(t.sent(id).size(), before);
    CHECK_EQ(f.sessions.session_count(), 1);
    CHECK(f.sessions.shared_pipeline("/tone") != nullptr);

    // Released once the timeout expires
    f.advance(1000000 + FRAME_US);
    CHECK_EQ(f.sessions.session_count(), 0);
    CHECK(f.sessions.shared_pipeline("/tone") == nullptr);
}

static void test_confirmed_close_releases_early() {
    Fixture f;
    RecordingTransport t(f.loop, f.sessions, true);
    SessionId id = f.sessions.open_session(&t);
    CHECK(f.sessions.on_setup(id, "/tone").is_ok());
    CHECK(f.sessions.on_teardown(id).is_ok());
    f.settle();
    CHECK_EQ(f.sessions.session_count(), 0);
    CHECK_EQ(f.loop.timer_count(), 0);
}

static void test_eager_pipeline_persists() {
    SessionManagerOptions options;
    options.eager_start = true;
    Fixture f(options);
    f.sessions.start_eager();

    // Shared mounts only
    CHECK(f.sessions.shared_pipeline("/tone") != nullptr);
    CHECK(f.sessions.shared_pipeline("/private") == nullptr);
    f.advance(5 * FRAME_US);
    CHECK_EQ(f.sessions.shared_pipeline("/tone")->stats(0).frames, 5);

    RecordingTransport t(f.loop, f.sessions);
    SessionId id = f.sessions.open_session(&t);
    CHECK(f.sessions.on_setup(id, "/tone").is_ok());
    CHECK(f.sessions.on_play(id).is_ok());
    f.advance(FRAME_US);
    CHECK_EQ(t.sent(id).size(), 1);
    CHECK(f.sessions.on_teardown(id).is_ok());
    f.settle();

    CHECK_EQ(f.sessions.session_count(), 0);
    CHECK(f.sessions.shared_pipeline("/tone") != nullptr);
}

static void test_shutdown() {
    Fixture f;
    RecordingTransport t(f.loop, f.sessions);
    SessionId a = f.sessions.open_session(&t);
    SessionId b = f.sessions.open_session(&t);
    CHECK(f.sessions.on_setup(a, "/tone").is_ok());
    CHECK(f.sessions.on_play(a).is_ok());
    f.advance(FRAME_US);

    f.sessions.shutdown();
    CHECK(f.info(a).teardown_reason == ErrorCode::Shutdown);
    CHECK(f.info(b).state == SessionState::TornDown);
    CHECK(f.loop.run_until_done([&]() { return f.sessions.idle(); }, 3000000));
    CHECK_EQ(f.sessions.pipeline_count(), 0);

    SessionId late = f.sessions.open_session(&t);
    CHECK(f.sessions.on_setup(late, "/tone").code == ErrorCode::Shutdown);
}

static std::string write_pcm_file(size_t frames) {
    char path[] = "/tmp/testsrc_pcm_XXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) {
        return std::string();
    }
    std::vector<int16_t> pcm(frames * 160, 1000);
    size_t bytes = pcm.size() * sizeof(int16_t);
    bool ok = write(fd, pcm.data(), bytes) == static_cast<ssize_t>(bytes);
    close(fd);
    if (!ok) {
        unlink(path);
        return std::string();
    }
    return path;
}

static void test_end_of_stream() {
    std::string path = write_pcm_file(2);
    CHECK(!path.empty());

    Fixture f;
    f.registry.register_stream(stream("/clip", pcmu_file(path), false));
    RecordingTransport t(f.loop, f.sessions, false);
    SessionId id = f.sessions.open_session(&t);
    CHECK(f.sessions.on_setup(id, "/clip").is_ok());
    CHECK(f.sessions.on_play(id).is_ok());
    f.advance(5 * FRAME_US);

    CHECK_EQ(t.sent(id).size(), 2);
    SessionInfo info = f.info(id);
    CHECK(info.state == SessionState::TornDown);
    CHECK(info.teardown_reason == ErrorCode::EndOfStream);
    unlink(path.c_str());
}

static void test_source_unavailable_at_setup() {
    Fixture f;
    f.registry.register_stream(stream("/missing", pcmu_file("/nonexistent/clip.pcm"), true));
    RecordingTransport t(f.loop, f.sessions);
    SessionId id = f.sessions.open_session(&t);

    Status status = f.sessions.on_setup(id, "/missing");
    CHECK(status.code == ErrorCode::SourceUnavailable);
    CHECK(status.message.find("/missing") != std::string::npos);
    CHECK(f.info(id).state == SessionState::Init);
    CHECK_EQ(f.sessions.pipeline_count(), 0);

    // Other mounts are unaffected
    CHECK(f.sessions.on_setup(id, "/tone").is_ok());
}

int main() {
    RUN_TEST(test_state_machine);
    RUN_TEST(test_torn_down_rejects_verbs);
    RUN_TEST(test_describe);
    RUN_TEST(test_delivery_only_when_playing);
    RUN_TEST(test_late_joiner_rewrite);
    RUN_TEST(test_queue_drops_oldest);
    RUN_TEST(test_shared_pause_resume);
    RUN_TEST(test_private_pipeline_pause);
    RUN_TEST(test_send_failure_tears_down);
    RUN_TEST(test_transport_failure_reason);
    RUN_TEST(test_teardown_timeout);
    RUN_TEST(test_confirmed_close_releases_early);
    RUN_TEST(test_eager_pipeline_persists);
    RUN_TEST(test_shutdown);
    RUN_TEST(test_end_of_stream);
    RUN_TEST(test_source_unavailable_at_setup);
    return test_summary("test_session_manager");
}
