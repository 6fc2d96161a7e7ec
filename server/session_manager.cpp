/*
 * Session Manager Implementation
 */

#include "session_manager.h"
#include "config/server_config.h"
#include <algorithm>
#include <cstdio>
#include <set>

struct SessionManager::PipelineSlot {
    std::string path;
    bool shared = false;
    bool eager = false;
    std::unique_ptr<Pipeline> pipeline;
    std::vector<SessionId> sessions;   // Attached and not yet reaped
};

struct SessionManager::Session {
    struct Rewrite {
        bool selected = false;
        bool started = false;
        uint16_t next_sequence = 0;
        uint32_t timestamp_base = 0;
        uint32_t first_timestamp = 0;   // Pipeline timestamp of the first packet
        uint32_t ssrc = 0;
    };

    SessionId id = 0;
    Transport* transport = nullptr;
    SessionState state = SessionState::Init;
    const StreamEntry* entry = nullptr;
    std::shared_ptr<PipelineSlot> slot;
    std::vector<Rewrite> rewrite;

    std::deque<QueuedPacket> queue;
    bool blocked = false;

    ErrorCode teardown_reason = ErrorCode::Ok;
    std::string teardown_message;
    DispatchLoop::TimerId teardown_timer = 0;

    SessionStats stats;
};

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Init:     return "INIT";
        case SessionState::Ready:    return "READY";
        case SessionState::Playing:  return "PLAYING";
        case SessionState::TornDown: return "TORN_DOWN";
    }
    return "unknown";
}

SessionManager::SessionManager(const StreamRegistry& registry, DispatchLoop& loop,
                               const SessionManagerOptions& options)
    : registry_(registry)
    , loop_(loop)
    , options_(options)
    , rng_(std::random_device()())
{
    if (options_.queue_size < 1) {
        options_.queue_size = 1;
    }
}

SessionManager::~SessionManager() {
    for (auto& kv : sessions_) {
        if (kv.second->teardown_timer) {
            loop_.cancel_timer(kv.second->teardown_timer);
        }
    }
    sessions_.clear();
    shared_.clear();
}

SessionManager::Session* SessionManager::find(SessionId id) const {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.get();
}

Status SessionManager::describe(const std::string& path, std::vector<MediaDescriptor>& out) const {
    const StreamEntry* entry = registry_.lookup(path);
    if (!entry) {
        return Status(ErrorCode::NotFound, "no stream at " + path);
    }
    out = entry->media;
    return Status::ok();
}

std::shared_ptr<SessionManager::PipelineSlot> SessionManager::make_slot(const StreamEntry& entry, bool shared,
                                                                        Status& status) {
    std::shared_ptr<PipelineSlot> slot = std::make_shared<PipelineSlot>();
    slot->path = entry.path;
    slot->shared = shared;
    slot->pipeline.reset(new Pipeline(entry, loop_, options_.pipeline));

    status = slot->pipeline->start();
    if (!status.is_ok()) {
        fprintf(stderr, "[Session] Pipeline for %s failed to start: %s\n",
                entry.path.c_str(), status.to_string().c_str());
        return nullptr;
    }

    // The slot owns the pipeline, so the raw pointer outlives every callback
    PipelineSlot* raw = slot.get();
    slot->pipeline->set_packet_callback([this, raw](size_t media_index, const Packet& packet) {
        on_packet(raw, media_index, packet);
    });
    slot->pipeline->set_failure_callback([this, raw](const Status& failure) {
        on_pipeline_failure(raw, failure);
    });

    fprintf(stderr, "[Session] Started %s pipeline for %s\n", shared ? "shared" : "per-session", entry.path.c_str());
    return slot;
}

void SessionManager::start_eager() {
    if (!options_.eager_start) {
        return;
    }

    for (const auto& path : registry_.paths()) {
        const StreamEntry* entry = registry_.lookup(path);
        if (!entry->shared || shared_.count(path)) {
            continue;
        }
        Status status;
        std::shared_ptr<PipelineSlot> slot = make_slot(*entry, true, status);
        if (!slot) {
            continue;
        }
        slot->eager = true;
        slot->pipeline->activate();
        shared_[path] = slot;
    }
}

SessionId SessionManager::open_session(Transport* transport) {
    SessionId id = next_id_++;
    std::unique_ptr<Session> session(new Session());
    session->id = id;
    session->transport = transport;
    sessions_[id] = std::move(session);

    if (server_config::g_debug_session) {
        fprintf(stderr, "[Session] %llu opened (%s)\n", (unsigned long long)id,
                transport ? transport->name() : "no transport");
    }
    return id;
}

Status SessionManager::on_setup(SessionId id, const std::string& path, const std::vector<size_t>& media) {
    Session* s = find(id);
    if (!s) {
        return Status(ErrorCode::NotFound, "no session " + std::to_string(id));
    }
    if (shutting_down_) {
        return Status(ErrorCode::Shutdown, "server is shutting down");
    }
    if (s->state != SessionState::Init) {
        return Status(ErrorCode::InvalidState,
                      std::string("setup in state ") + session_state_name(s->state));
    }

    const StreamEntry* entry = registry_.lookup(path);
    if (!entry) {
        return Status(ErrorCode::NotFound, "no stream at " + path);
    }
    for (size_t index : media) {
        if (index >= entry->media.size()) {
            return Status(ErrorCode::NotFound, path + " has no media " + std::to_string(index));
        }
    }

    std::shared_ptr<PipelineSlot> slot;
    if (entry->shared) {
        auto it = shared_.find(path);
        if (it != shared_.end()) {
            slot = it->second;
        } else {
            Status status;
            slot = make_slot(*entry, true, status);
            if (!slot) {
                return status;
            }
            slot->pipeline->activate();
            shared_[path] = slot;
        }
    } else {
        Status status;
        slot = make_slot(*entry, false, status);
        if (!slot) {
            return status;
        }
    }

    s->entry = entry;
    s->slot = slot;
    slot->sessions.push_back(id);

    s->rewrite.assign(entry->media.size(), Session::Rewrite());
    std::set<uint32_t> used;
    for (size_t i = 0; i < entry->media.size(); i++) {
        Session::Rewrite& r = s->rewrite[i];
        r.selected = media.empty() || std::find(media.begin(), media.end(), i) != media.end();
        r.next_sequence = static_cast<uint16_t>(rng_());
        r.timestamp_base = static_cast<uint32_t>(rng_());
        do {
            r.ssrc = static_cast<uint32_t>(rng_());
        } while (r.ssrc == 0 || used.count(r.ssrc));
        used.insert(r.ssrc);
    }

    s->state = SessionState::Ready;
    if (server_config::g_debug_session) {
        fprintf(stderr, "[Session] %llu setup %s -> READY\n", (unsigned long long)id, path.c_str());
    }
    return Status::ok();
}

Status SessionManager::on_play(SessionId id) {
    Session* s = find(id);
    if (!s) {
        return Status(ErrorCode::NotFound, "no session " + std::to_string(id));
    }
    if (s->state == SessionState::Playing) {
        return Status::ok();
    }
    if (s->state != SessionState::Ready) {
        return Status(ErrorCode::InvalidState,
                      std::string("play in state ") + session_state_name(s->state));
    }

    Pipeline* pipeline = s->slot->pipeline.get();
    if (!s->slot->shared) {
        pipeline->activate();
    } else {
        // Joining a running stream: start the newcomer on a keyframe
        for (size_t i = 0; i < pipeline->media_count(); i++) {
            if (pipeline->descriptor(i).kind == MediaKind::Video && pipeline->stats(i).frames > 0) {
                pipeline->request_keyframe();
                break;
            }
        }
    }

    s->state = SessionState::Playing;
    if (server_config::g_debug_session) {
        fprintf(stderr, "[Session] %llu PLAYING\n", (unsigned long long)id);
    }
    return Status::ok();
}

Status SessionManager::on_pause(SessionId id) {
    Session* s = find(id);
    if (!s) {
        return Status(ErrorCode::NotFound, "no session " + std::to_string(id));
    }
    if (s->state == SessionState::Ready) {
        return Status::ok();
    }
    if (s->state != SessionState::Playing) {
        return Status(ErrorCode::InvalidState,
                      std::string("pause in state ") + session_state_name(s->state));
    }

    if (!s->slot->shared) {
        s->slot->pipeline->deactivate();
    }
    s->queue.clear();
    s->blocked = false;
    s->state = SessionState::Ready;
    if (server_config::g_debug_session) {
        fprintf(stderr, "[Session] %llu paused -> READY\n", (unsigned long long)id);
    }
    return Status::ok();
}

Status SessionManager::on_teardown(SessionId id) {
    Session* s = find(id);
    if (!s) {
        return Status(ErrorCode::NotFound, "no session " + std::to_string(id));
    }
    if (s->state != SessionState::TornDown) {
        teardown(id, ErrorCode::Ok, "client teardown");
    }
    return Status::ok();
}

void SessionManager::on_transport_writable(SessionId id) {
    Session* s = find(id);
    if (!s || s->state == SessionState::TornDown) {
        return;
    }
    s->blocked = false;
    flush(id);
}

void SessionManager::on_transport_failure(SessionId id, const std::string& reason) {
    Session* s = find(id);
    if (!s || s->state == SessionState::TornDown) {
        return;
    }
    teardown(id, ErrorCode::TransportFailure, reason);
}

void SessionManager::on_transport_closed(SessionId id) {
    Session* s = find(id);
    if (!s) {
        return;
    }
    if (s->state != SessionState::TornDown) {
        teardown(id, ErrorCode::TransportFailure, "transport closed");
    }
    loop_.post([this, id]() { reap(id); });
}

void SessionManager::shutdown() {
    shutting_down_ = true;

    std::vector<SessionId> ids;
    for (const auto& kv : sessions_) {
        ids.push_back(kv.first);
    }
    for (SessionId id : ids) {
        Session* s = find(id);
        if (s && s->state != SessionState::TornDown) {
            teardown(id, ErrorCode::Shutdown, "server shutdown");
        }
    }

    // Stop producing; idle shared pipelines go now, the rest with their sessions
    for (auto it = shared_.begin(); it != shared_.end();) {
        it->second->pipeline->deactivate();
        it->second->eager = false;
        if (it->second->sessions.empty()) {
            it = shared_.erase(it);
        } else {
            ++it;
        }
    }
}

bool SessionManager::session_info(SessionId id, SessionInfo& out) const {
    Session* s = find(id);
    if (!s) {
        return false;
    }

    SessionInfo info;
    info.id = s->id;
    info.state = s->state;
    info.path = s->entry ? s->entry->path : std::string();
    for (size_t i = 0; i < s->rewrite.size(); i++) {
        if (s->rewrite[i].selected) {
            info.media.push_back(i);
        }
        info.ssrc.push_back(s->rewrite[i].ssrc);
    }
    info.queued = s->queue.size();
    info.teardown_reason = s->teardown_reason;
    info.teardown_message = s->teardown_message;
    info.stats = s->stats;
    out = info;
    return true;
}

bool SessionManager::parameter_sets(SessionId id, size_t media_index,
                                    std::vector<uint8_t>& sps, std::vector<uint8_t>& pps) const {
    Session* s = find(id);
    if (!s || !s->slot) {
        return false;
    }
    return s->slot->pipeline->parameter_sets(media_index, sps, pps);
}

Pipeline* SessionManager::shared_pipeline(const std::string& path) const {
    auto it = shared_.find(path);
    return it == shared_.end() ? nullptr : it->second->pipeline.get();
}

size_t SessionManager::pipeline_count() const {
    std::set<const PipelineSlot*> slots;
    for (const auto& kv : shared_) {
        slots.insert(kv.second.get());
    }
    for (const auto& kv : sessions_) {
        if (kv.second->slot) {
            slots.insert(kv.second->slot.get());
        }
    }
    return slots.size();
}

void SessionManager::print_stats() const {
    fprintf(stderr, "[Session] %zu sessions, %zu pipelines\n", sessions_.size(), pipeline_count());
    for (const auto& kv : sessions_) {
        const Session& s = *kv.second;
        fprintf(stderr, "[Session]   %llu %s %s sent=%llu dropped=%llu queued=%zu\n",
                (unsigned long long)s.id, session_state_name(s.state),
                s.entry ? s.entry->path.c_str() : "-",
                (unsigned long long)s.stats.packets_sent, (unsigned long long)s.stats.packets_dropped,
                s.queue.size());
    }
    for (const auto& kv : shared_) {
        kv.second->pipeline->print_stats();
    }
}

void SessionManager::on_packet(PipelineSlot* slot, size_t media_index, const Packet& packet) {
    // Sessions may be torn down while we deliver
    std::vector<SessionId> ids = slot->sessions;
    for (SessionId id : ids) {
        Session* s = find(id);
        if (!s || s->state != SessionState::Playing || !s->rewrite[media_index].selected) {
            continue;
        }
        enqueue(*s, media_index, packet);
        flush(id);
    }
}

void SessionManager::on_pipeline_failure(PipelineSlot* slot, const Status& status) {
    std::vector<SessionId> ids = slot->sessions;
    const std::string path = slot->path;

    fprintf(stderr, "[Session] Pipeline for %s stopped (%s), tearing down %zu session(s)\n",
            path.c_str(), error_code_name(status.code), ids.size());

    // A new setup starts a fresh pipeline
    auto it = shared_.find(path);
    if (it != shared_.end() && it->second.get() == slot) {
        shared_.erase(it);
    }

    for (SessionId id : ids) {
        Session* s = find(id);
        if (s && s->state != SessionState::TornDown) {
            teardown(id, status.code, status.message);
        }
    }
}

void SessionManager::enqueue(Session& session, size_t media_index, const Packet& packet) {
    Session::Rewrite& r = session.rewrite[media_index];
    if (!r.started) {
        r.started = true;
        r.first_timestamp = packet.timestamp;
    }

    QueuedPacket q;
    q.media = media_index;
    q.ssrc = r.ssrc;
    q.packet = packet;
    q.packet.sequence = r.next_sequence++;
    q.packet.timestamp = r.timestamp_base + (packet.timestamp - r.first_timestamp);

    if (session.queue.size() >= options_.queue_size) {
        session.queue.pop_front();
        session.stats.packets_dropped++;
        if (server_config::g_debug_session &&
            (session.stats.packets_dropped == 1 || session.stats.packets_dropped % 100 == 0)) {
            fprintf(stderr, "[Session] %llu queue full, dropped %llu packet(s)\n",
                    (unsigned long long)session.id, (unsigned long long)session.stats.packets_dropped);
        }
    }
    session.queue.push_back(std::move(q));
}

void SessionManager::flush(SessionId id) {
    Session* s = find(id);
    if (!s || !s->transport) {
        return;
    }

    while (!s->queue.empty() && !s->blocked && s->state == SessionState::Playing) {
        const QueuedPacket& q = s->queue.front();
        SendResult result = s->transport->send(id, q.media, q.packet, q.ssrc);

        if (result == SendResult::Sent) {
            s->stats.packets_sent++;
            s->stats.bytes_sent += RTP_HEADER_SIZE + q.packet.payload_size();
            s->queue.pop_front();
        } else if (result == SendResult::WouldBlock) {
            s->blocked = true;
            s->stats.would_block++;
        } else {
            teardown(id, ErrorCode::TransportFailure, std::string(s->transport->name()) + " send failed");
            return;
        }
    }
}

void SessionManager::teardown(SessionId id, ErrorCode reason, const std::string& message) {
    Session* s = find(id);
    if (!s || s->state == SessionState::TornDown) {
        return;
    }

    SessionState previous = s->state;
    s->state = SessionState::TornDown;
    s->teardown_reason = reason;
    s->teardown_message = message;
    s->queue.clear();
    s->blocked = false;

    if (s->slot && !s->slot->shared) {
        s->slot->pipeline->deactivate();
    }

    fprintf(stderr, "[Session] %llu torn down from %s: %s%s%s\n", (unsigned long long)id,
            session_state_name(previous),
            reason == ErrorCode::Ok ? "" : error_code_name(reason),
            reason == ErrorCode::Ok ? "" : ": ", message.c_str());

    s->teardown_timer = loop_.schedule_after(static_cast<int64_t>(options_.teardown_timeout_ms) * 1000,
                                             [this, id]() {
        Session* late = find(id);
        if (late) {
            late->teardown_timer = 0;
            if (server_config::g_debug_session) {
                fprintf(stderr, "[Session] %llu teardown timeout\n", (unsigned long long)id);
            }
        }
        reap(id);
    });

    if (s->transport) {
        s->transport->close_session(id);
    } else {
        loop_.post([this, id]() { reap(id); });
    }
}

void SessionManager::reap(SessionId id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return;
    }
    Session& s = *it->second;
    if (s.teardown_timer) {
        loop_.cancel_timer(s.teardown_timer);
        s.teardown_timer = 0;
    }
    release_pipeline(s);
    sessions_.erase(it);

    if (server_config::g_debug_session) {
        fprintf(stderr, "[Session] %llu released\n", (unsigned long long)id);
    }
}

void SessionManager::release_pipeline(Session& session) {
    std::shared_ptr<PipelineSlot> slot = session.slot;
    if (!slot) {
        return;
    }
    session.slot.reset();
    slot->sessions.erase(std::remove(slot->sessions.begin(), slot->sessions.end(), session.id),
                         slot->sessions.end());

    if (slot->shared && slot->sessions.empty() && !slot->eager) {
        auto it = shared_.find(slot->path);
        if (it != shared_.end() && it->second == slot) {
            fprintf(stderr, "[Session] Stopping idle pipeline for %s\n", slot->path.c_str());
            shared_.erase(it);
        }
    }
}
