/*
 * WebRTC Transport Implementation
 */

#include "webrtc_transport.h"
#include "../config/server_config.h"
#include "../h264_nal.h"
#include <cstddef>
#include <cstdio>

using json_utils::json;

namespace {

// Post from a libdatachannel thread; dropped if the transport is gone
void post_guarded(DispatchLoop* loop, const std::weak_ptr<int>& alive, std::function<void()> fn) {
    loop->post([alive, fn]() {
        if (!alive.expired()) {
            fn();
        }
    });
}

const char* pc_state_name(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return "New";
        case rtc::PeerConnection::State::Connecting: return "Connecting";
        case rtc::PeerConnection::State::Connected: return "Connected";
        case rtc::PeerConnection::State::Disconnected: return "Disconnected";
        case rtc::PeerConnection::State::Failed: return "Failed";
        case rtc::PeerConnection::State::Closed: return "Closed";
    }
    return "unknown";
}

} // namespace

json description_message(const std::string& path, const std::vector<MediaDescriptor>& media) {
    json list = json::array();
    for (const auto& desc : media) {
        json entry = {
            {"kind", media_kind_name(desc.kind)},
            {"codec", codec_name(desc.codec)},
            {"payload_type", desc.payload_type},
            {"clock_rate", desc.clock_rate},
            {"channels", desc.channels},
            {"rtpmap", desc.rtpmap()},
            {"fmtp", desc.fmtp()}
        };
        if (desc.kind == MediaKind::Video) {
            entry["width"] = desc.width;
            entry["height"] = desc.height;
        }
        list.push_back(entry);
    }
    return json{
        {"type", "description"},
        {"path", path},
        {"media", list}
    };
}

json error_message(const Status& status) {
    return json{
        {"type", "error"},
        {"code", error_code_name(status.code)},
        {"message", status.message}
    };
}

WebRtcTransport::WebRtcTransport(DispatchLoop& loop, SessionManager& sessions, const WebRtcOptions& options)
    : loop_(loop)
    , sessions_(sessions)
    , options_(options)
    , alive_(std::make_shared<int>(0))
{}

WebRtcTransport::~WebRtcTransport() {
    stop();
    alive_.reset();
}

bool WebRtcTransport::init() {
    rtc::InitLogger(rtc::LogLevel::Error);
    rtc::Preload();

    try {
        rtc::WebSocketServer::Configuration config;
        config.port = static_cast<uint16_t>(options_.signaling_port);
        config.enableTls = false;

        ws_server_.reset(new rtc::WebSocketServer(config));
        ws_server_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) {
            on_client(ws);
        });
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Failed to start signaling server: %s\n", e.what());
        return false;
    }

    fprintf(stderr, "[WebRTC] Signaling server on port %d\n", options_.signaling_port);
    return true;
}

void WebRtcTransport::stop() {
    for (auto& kv : peers_) {
        Peer& peer = *kv.second;
        peer.closing = true;
        if (peer.pc) {
            peer.pc->close();
        }
        if (peer.ws) {
            peer.ws->close();
        }
    }
    peers_.clear();

    if (ws_server_) {
        ws_server_->stop();
        ws_server_.reset();
    }
}

void WebRtcTransport::post(std::function<void()> fn) {
    post_guarded(&loop_, alive_, std::move(fn));
}

void WebRtcTransport::on_client(std::shared_ptr<rtc::WebSocket> ws) {
    // Signaling thread
    std::shared_ptr<Peer> peer = std::make_shared<Peer>();
    peer->ws = ws;

    std::weak_ptr<Peer> weak = peer;
    std::weak_ptr<int> alive = alive_;
    DispatchLoop* loop = &loop_;

    ws->onMessage([this, weak, alive, loop](auto data) {
        if (!std::holds_alternative<std::string>(data)) {
            return;
        }
        std::string text = std::get<std::string>(data);
        post_guarded(loop, alive, [this, weak, text]() {
            std::shared_ptr<Peer> p = weak.lock();
            if (p) {
                on_message(p, text);
            }
        });
    });

    ws->onError([](std::string error) {
        fprintf(stderr, "[WebRTC] WebSocket error: %s\n", error.c_str());
    });

    ws->onClosed([this, weak, alive, loop]() {
        post_guarded(loop, alive, [this, weak]() {
            std::shared_ptr<Peer> p = weak.lock();
            if (p) {
                on_socket_closed(p);
            }
        });
    });

    // Registered on the loop before any of its messages
    post([this, peer]() {
        peer->session = sessions_.open_session(this);
        peers_[peer->session] = peer;
        if (server_config::g_debug_transport) {
            fprintf(stderr, "[WebRTC] Client connected, session %llu (%zu peers)\n",
                    (unsigned long long)peer->session, peers_.size());
        }
    });
}

void WebRtcTransport::on_message(const std::shared_ptr<Peer>& peer, const std::string& text) {
    if (peer->closing) {
        return;
    }

    json msg;
    try {
        msg = json_utils::parse(text);
    } catch (const json::exception& e) {
        send_json(*peer, error_message(Status(ErrorCode::InvalidState, std::string("malformed message: ") + e.what())));
        return;
    }

    std::string type = json_utils::get_string(msg, "type");
    if (server_config::g_debug_transport) {
        fprintf(stderr, "[WebRTC] Session %llu: %s\n", (unsigned long long)peer->session, type.c_str());
    }

    if (type == "describe") {
        handle_describe(*peer, msg);
    } else if (type == "setup") {
        handle_setup(peer, msg);
    } else if (type == "answer") {
        handle_answer(*peer, msg);
    } else if (type == "candidate") {
        handle_candidate(*peer, msg);
    } else if (type == "play") {
        reply_state(*peer, sessions_.on_play(peer->session));
    } else if (type == "pause") {
        reply_state(*peer, sessions_.on_pause(peer->session));
    } else if (type == "teardown") {
        send_json(*peer, json{{"type", "state"}, {"state", session_state_name(SessionState::TornDown)}});
        Status status = sessions_.on_teardown(peer->session);
        if (!status.is_ok()) {
            send_json(*peer, error_message(status));
        }
    } else {
        send_json(*peer, error_message(Status(ErrorCode::InvalidState, "unknown message type '" + type + "'")));
    }
}

void WebRtcTransport::on_socket_closed(const std::shared_ptr<Peer>& peer) {
    if (peer->closing) {
        return;
    }
    if (server_config::g_debug_transport) {
        fprintf(stderr, "[WebRTC] Session %llu: WebSocket closed\n", (unsigned long long)peer->session);
    }
    sessions_.on_transport_closed(peer->session);
}

void WebRtcTransport::handle_describe(Peer& peer, const json& msg) {
    std::string path = json_utils::get_string(msg, "path");
    std::vector<MediaDescriptor> media;
    Status status = sessions_.describe(path, media);
    if (!status.is_ok()) {
        send_json(peer, error_message(status));
        return;
    }
    send_json(peer, description_message(path, media));
}

void WebRtcTransport::handle_setup(const std::shared_ptr<Peer>& peer, const json& msg) {
    std::string path = json_utils::get_string(msg, "path");
    std::vector<MediaDescriptor> media;
    Status status = sessions_.describe(path, media);
    if (!status.is_ok()) {
        send_json(*peer, error_message(status));
        return;
    }

    std::vector<size_t> selected = select_best_media(media);
    if (server_config::g_debug_transport) {
        for (size_t index : selected) {
            const MediaDescriptor& desc = media[index];
            fprintf(stderr, "[WebRTC] Session %llu: selected %s #%zu %s %dx%d\n",
                    (unsigned long long)peer->session, media_kind_name(desc.kind), index,
                    codec_name(desc.codec), desc.width, desc.height);
        }
    }
    status = sessions_.on_setup(peer->session, path, selected);
    if (!status.is_ok()) {
        send_json(*peer, error_message(status));
        return;
    }
    peer->path = path;

    try {
        create_peer_connection(peer, media, selected);
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Session %llu: peer connection setup failed: %s\n",
                (unsigned long long)peer->session, e.what());
        send_json(*peer, error_message(Status(ErrorCode::TransportFailure, e.what())));
        sessions_.on_transport_failure(peer->session, e.what());
    }
}

void WebRtcTransport::handle_answer(Peer& peer, const json& msg) {
    if (!peer.pc) {
        send_json(peer, error_message(Status(ErrorCode::InvalidState, "answer before setup")));
        return;
    }
    std::string sdp = json_utils::get_string(msg, "sdp");
    try {
        peer.pc->setRemoteDescription(rtc::Description(sdp, "answer"));
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Session %llu: bad answer: %s\n", (unsigned long long)peer.session, e.what());
        send_json(peer, error_message(Status(ErrorCode::TransportFailure, std::string("bad answer: ") + e.what())));
    }
}

void WebRtcTransport::handle_candidate(Peer& peer, const json& msg) {
    if (!peer.pc) {
        send_json(peer, error_message(Status(ErrorCode::InvalidState, "candidate before setup")));
        return;
    }
    std::string candidate = json_utils::get_string(msg, "candidate");
    std::string mid = json_utils::get_string(msg, "mid");
    if (candidate.empty()) {
        return;  // End of candidates
    }
    try {
        peer.pc->addRemoteCandidate(rtc::Candidate(candidate, mid));
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Session %llu: failed to add candidate: %s\n",
                (unsigned long long)peer.session, e.what());
    }
}

void WebRtcTransport::reply_state(Peer& peer, const Status& status) {
    if (!status.is_ok()) {
        send_json(peer, error_message(status));
        return;
    }
    SessionInfo info;
    if (sessions_.session_info(peer.session, info)) {
        send_json(peer, json{{"type", "state"}, {"state", session_state_name(info.state)}});
    }
}

void WebRtcTransport::create_peer_connection(const std::shared_ptr<Peer>& peer,
                                             const std::vector<MediaDescriptor>& media,
                                             const std::vector<size_t>& selected) {
    const SessionId id = peer->session;
    SessionInfo info;
    if (!sessions_.session_info(id, info)) {
        throw std::runtime_error("session vanished during setup");
    }

    rtc::Configuration config;
    if (options_.enable_stun) {
        config.iceServers.emplace_back(options_.stun_server);
    }
    peer->pc = std::make_shared<rtc::PeerConnection>(config);

    std::weak_ptr<rtc::WebSocket> weak_ws = peer->ws;
    std::weak_ptr<int> alive = alive_;
    DispatchLoop* loop = &loop_;

    peer->pc->onLocalDescription([weak_ws, id](rtc::Description desc) {
        std::shared_ptr<rtc::WebSocket> ws = weak_ws.lock();
        if (!ws) {
            return;
        }
        json msg = {
            {"type", desc.typeString()},
            {"sdp", std::string(desc)}
        };
        ws->send(json_utils::to_string(msg));
        if (server_config::g_debug_transport) {
            fprintf(stderr, "[WebRTC] Session %llu: sent %s\n", (unsigned long long)id, desc.typeString().c_str());
        }
    });

    peer->pc->onLocalCandidate([weak_ws](rtc::Candidate cand) {
        std::shared_ptr<rtc::WebSocket> ws = weak_ws.lock();
        if (!ws) {
            return;
        }
        json msg = {
            {"type", "candidate"},
            {"candidate", std::string(cand)},
            {"mid", cand.mid()}
        };
        ws->send(json_utils::to_string(msg));
    });

    peer->pc->onStateChange([this, id, alive, loop](rtc::PeerConnection::State state) {
        if (server_config::g_debug_transport) {
            fprintf(stderr, "[WebRTC] Session %llu: peer %s\n", (unsigned long long)id, pc_state_name(state));
        }
        if (state == rtc::PeerConnection::State::Failed || state == rtc::PeerConnection::State::Disconnected) {
            std::string reason = std::string("peer connection ") + pc_state_name(state);
            post_guarded(loop, alive, [this, id, reason]() { sessions_.on_transport_failure(id, reason); });
        } else if (state == rtc::PeerConnection::State::Closed) {
            post_guarded(loop, alive, [this, id]() { sessions_.on_transport_closed(id); });
        }
    });

    peer->tracks.assign(media.size(), nullptr);
    for (size_t index : selected) {
        const MediaDescriptor& desc = media[index];
        const std::string mid = std::string(media_kind_name(desc.kind)) + std::to_string(index);

        rtc::Description::Media::RtpMap rtpmap(std::to_string(desc.payload_type) + " " + desc.rtpmap());
        std::string fmtp = desc.fmtp();
        if (desc.codec == CodecType::H264) {
            std::vector<uint8_t> sps, pps;
            if (sessions_.parameter_sets(id, index, sps, pps)) {
                MediaDescriptor actual = desc;
                actual.params["profile-level-id"] = h264::profile_level_id(sps);
                fmtp = actual.fmtp() + ";sprop-parameter-sets=" + h264::sprop_parameter_sets(sps, pps);
            }
        }
        if (!fmtp.empty()) {
            rtpmap.fmtps.push_back(fmtp);
        }

        std::shared_ptr<rtc::Track> track;
        if (desc.kind == MediaKind::Video) {
            rtc::Description::Video description(mid, rtc::Description::Direction::SendOnly);
            description.addRtpMap(rtpmap);
            description.addSSRC(info.ssrc[index], "rtsp-testsrc", "stream", mid);
            track = peer->pc->addTrack(description);
        } else {
            rtc::Description::Audio description(mid, rtc::Description::Direction::SendOnly);
            description.addRtpMap(rtpmap);
            description.addSSRC(info.ssrc[index], "rtsp-testsrc", "stream", mid);
            track = peer->pc->addTrack(description);
        }

        // Packets are already RTP; keep them for retransmission on NACK
        track->setMediaHandler(std::make_shared<rtc::RtcpNackResponder>());

        track->onOpen([this, id, mid, alive, loop]() {
            if (server_config::g_debug_transport) {
                fprintf(stderr, "[WebRTC] Session %llu: track %s open\n", (unsigned long long)id, mid.c_str());
            }
            post_guarded(loop, alive, [this, id]() { sessions_.on_transport_writable(id); });
        });

        track->onClosed([id, mid]() {
            if (server_config::g_debug_transport) {
                fprintf(stderr, "[WebRTC] Session %llu: track %s closed\n", (unsigned long long)id, mid.c_str());
            }
        });

        track->onError([id, mid](std::string error) {
            fprintf(stderr, "[WebRTC] Session %llu: track %s error: %s\n",
                    (unsigned long long)id, mid.c_str(), error.c_str());
        });

        peer->tracks[index] = track;
    }

    peer->pc->setLocalDescription();
    fprintf(stderr, "[WebRTC] Session %llu: offering %zu track(s) of %s\n",
            (unsigned long long)id, selected.size(), peer->path.c_str());
}

SendResult WebRtcTransport::send(SessionId session, size_t media_index, const Packet& packet, uint32_t ssrc) {
    auto it = peers_.find(session);
    if (it == peers_.end() || it->second->closing) {
        return SendResult::Failed;
    }
    Peer& peer = *it->second;
    if (media_index >= peer.tracks.size() || !peer.tracks[media_index]) {
        return SendResult::Sent;  // Not negotiated for this peer
    }

    std::shared_ptr<rtc::Track>& track = peer.tracks[media_index];
    if (!track->isOpen()) {
        return SendResult::WouldBlock;
    }

    std::vector<uint8_t> datagram = packet.serialize(ssrc);
    try {
        track->send(reinterpret_cast<const std::byte*>(datagram.data()), datagram.size());
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Session %llu: send failed: %s\n", (unsigned long long)session, e.what());
        return SendResult::Failed;
    }
    return SendResult::Sent;
}

void WebRtcTransport::close_session(SessionId session) {
    auto it = peers_.find(session);
    if (it == peers_.end()) {
        sessions_.on_transport_closed(session);
        return;
    }
    std::shared_ptr<Peer> peer = it->second;
    peers_.erase(it);
    peer->closing = true;

    SessionInfo info;
    if (sessions_.session_info(session, info) && info.teardown_reason != ErrorCode::Ok) {
        send_json(*peer, error_message(Status(info.teardown_reason, info.teardown_message)));
    }

    // Closure is confirmed by the peer connection's Closed state
    if (peer->pc) {
        peer->pc->close();
    }
    if (peer->ws) {
        peer->ws->close();
    }
    if (!peer->pc) {
        sessions_.on_transport_closed(session);
    }
}

void WebRtcTransport::send_json(Peer& peer, const json& msg) {
    if (!peer.ws || !peer.ws->isOpen()) {
        return;
    }
    try {
        peer.ws->send(json_utils::to_string(msg));
    } catch (const std::exception& e) {
        fprintf(stderr, "[WebRTC] Session %llu: failed to send message: %s\n",
                (unsigned long long)peer.session, e.what());
    }
}
