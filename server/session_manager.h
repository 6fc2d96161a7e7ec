/*
 * Session Manager
 *
 * Client session lifecycle:
 *
 *   INIT --setup--> READY --play--> PLAYING --pause--> READY
 *     \               \               \
 *      +---------------+---------------+--> TORN_DOWN
 *
 * Teardown comes from the client, the transport (failure/disconnect), the
 * pipeline (source/encoder failure, end of stream) or server shutdown.
 *
 * Shared mounts run one pipeline for all of their sessions, created on the
 * first setup (or at startup when eager). Every session receives its own
 * copy of each packet, rewritten with a session-local sequence number,
 * timestamp offset and SSRC, through its own bounded queue. When a queue is
 * full the oldest packet is dropped, so one stalled transport never holds
 * back its siblings. Non-shared mounts get one pipeline per session.
 *
 * After teardown the session stays around until its transport reports
 * closure or the teardown timeout expires; only then is its pipeline
 * reference released.
 */

#ifndef SESSION_MANAGER_H
#define SESSION_MANAGER_H

#include "dispatch_loop.h"
#include "pipeline.h"
#include "status.h"
#include "stream_registry.h"
#include "transport/transport.h"
#include <deque>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

enum class SessionState {
    Init,
    Ready,
    Playing,
    TornDown
};

const char* session_state_name(SessionState state);

struct SessionStats {
    uint64_t packets_sent = 0;
    uint64_t bytes_sent = 0;
    uint64_t packets_dropped = 0;   // Queue overflow
    uint64_t would_block = 0;
};

struct SessionManagerOptions {
    size_t queue_size = 512;
    int teardown_timeout_ms = 2000;
    bool eager_start = false;
    PipelineOptions pipeline;
};

// Read-only view of a session for transports and tests
struct SessionInfo {
    SessionId id = 0;
    SessionState state = SessionState::Init;
    std::string path;
    std::vector<size_t> media;          // Selected media indices
    std::vector<uint32_t> ssrc;         // Per media index of the stream
    size_t queued = 0;
    ErrorCode teardown_reason = ErrorCode::Ok;
    std::string teardown_message;
    SessionStats stats;
};

class SessionManager {
public:
    SessionManager(const StreamRegistry& registry, DispatchLoop& loop, const SessionManagerOptions& options);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * Media descriptors of a mount
     * @return NotFound if the path is not registered
     */
    Status describe(const std::string& path, std::vector<MediaDescriptor>& out) const;

    /**
     * Start the pipelines of shared mounts at startup
     * Failures are logged and leave the mount to start on demand.
     */
    void start_eager();

    // New session in INIT, delivering through `transport`
    SessionId open_session(Transport* transport);

    /**
     * INIT -> READY: bind the session to a mount
     * @param media Media indices to deliver (all if empty)
     */
    Status on_setup(SessionId id, const std::string& path, const std::vector<size_t>& media = std::vector<size_t>());
    Status on_play(SessionId id);
    Status on_pause(SessionId id);
    Status on_teardown(SessionId id);

    // Transport notifications
    void on_transport_writable(SessionId id);
    void on_transport_failure(SessionId id, const std::string& reason);
    void on_transport_closed(SessionId id);

    // Tear down every session with reason Shutdown
    void shutdown();

    // True when no session is left (all closed or timed out)
    bool idle() const { return sessions_.empty(); }

    bool session_info(SessionId id, SessionInfo& out) const;

    // H.264 parameter sets of a session's media (for offers / SDP)
    bool parameter_sets(SessionId id, size_t media_index, std::vector<uint8_t>& sps, std::vector<uint8_t>& pps) const;

    // Running pipeline of a shared mount, or nullptr
    Pipeline* shared_pipeline(const std::string& path) const;

    size_t session_count() const { return sessions_.size(); }
    size_t pipeline_count() const;

    void print_stats() const;

private:
    struct PipelineSlot;
    struct Session;

    struct QueuedPacket {
        size_t media;
        uint32_t ssrc;
        Packet packet;
    };

    Session* find(SessionId id) const;
    std::shared_ptr<PipelineSlot> make_slot(const StreamEntry& entry, bool shared, Status& status);
    void on_packet(PipelineSlot* slot, size_t media_index, const Packet& packet);
    void on_pipeline_failure(PipelineSlot* slot, const Status& status);
    void enqueue(Session& session, size_t media_index, const Packet& packet);
    void flush(SessionId id);
    void teardown(SessionId id, ErrorCode reason, const std::string& message);
    void reap(SessionId id);
    void release_pipeline(Session& session);

    const StreamRegistry& registry_;
    DispatchLoop& loop_;
    SessionManagerOptions options_;

    std::map<SessionId, std::unique_ptr<Session>> sessions_;
    std::map<std::string, std::shared_ptr<PipelineSlot>> shared_;
    SessionId next_id_ = 1;
    std::mt19937 rng_;
    bool shutting_down_ = false;
};

#endif // SESSION_MANAGER_H
