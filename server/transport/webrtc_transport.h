/*
 * WebRTC Transport
 *
 * libdatachannel peer connections negotiated over a WebSocket JSON
 * signaling channel. One WebSocket connection is one session.
 *
 * Client -> server:
 *   {"type":"describe","path":"/test"}
 *   {"type":"setup","path":"/test"}        -> server offer
 *   {"type":"answer","sdp":"..."}
 *   {"type":"candidate","candidate":"...","mid":"..."}
 *   {"type":"play"} / {"type":"pause"} / {"type":"teardown"}
 *
 * Server -> client:
 *   {"type":"description","path","media":[...]}
 *   {"type":"offer","sdp"} / {"type":"candidate",...}
 *   {"type":"state","state":"PLAYING"}
 *   {"type":"error","code","message"}
 *
 * The offer carries one send-only track per selected media: the best
 * video and the best audio of the mount by codec priority. Packets arrive
 * already RTP-packetized and are written to the tracks as-is.
 *
 * libdatachannel callbacks run on its own threads; each one is posted to
 * the dispatch loop before touching any state.
 */

#ifndef WEBRTC_TRANSPORT_H
#define WEBRTC_TRANSPORT_H

#include "transport.h"
#include "../dispatch_loop.h"
#include "../session_manager.h"
#include "../status.h"
#include "../utils/json_utils.h"
#include <rtc/rtc.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct WebRtcOptions {
    int signaling_port = 8554;
    bool enable_stun = false;
    std::string stun_server = "stun:stun.l.google.com:19302";
};

// {"type":"description",...} reply for a mount
json_utils::json description_message(const std::string& path, const std::vector<MediaDescriptor>& media);

// {"type":"error",...} message
json_utils::json error_message(const Status& status);

class WebRtcTransport : public Transport {
public:
    WebRtcTransport(DispatchLoop& loop, SessionManager& sessions, const WebRtcOptions& options);
    ~WebRtcTransport() override;

    WebRtcTransport(const WebRtcTransport&) = delete;
    WebRtcTransport& operator=(const WebRtcTransport&) = delete;

    // Start the signaling server
    bool init();

    // Close every peer and the signaling server
    void stop();

    size_t peer_count() const { return peers_.size(); }

    const char* name() const override { return "webrtc"; }
    SendResult send(SessionId session, size_t media_index, const Packet& packet, uint32_t ssrc) override;
    void close_session(SessionId session) override;

private:
    struct Peer {
        SessionId session = 0;
        std::shared_ptr<rtc::WebSocket> ws;
        std::shared_ptr<rtc::PeerConnection> pc;
        std::vector<std::shared_ptr<rtc::Track>> tracks;   // Per stream media, null if not selected
        std::string path;
        bool closing = false;
    };

    // Run `fn` on the loop thread if this transport still exists
    void post(std::function<void()> fn);

    void on_client(std::shared_ptr<rtc::WebSocket> ws);
    void on_message(const std::shared_ptr<Peer>& peer, const std::string& text);
    void on_socket_closed(const std::shared_ptr<Peer>& peer);

    void handle_describe(Peer& peer, const json_utils::json& msg);
    void handle_setup(const std::shared_ptr<Peer>& peer, const json_utils::json& msg);
    void handle_answer(Peer& peer, const json_utils::json& msg);
    void handle_candidate(Peer& peer, const json_utils::json& msg);
    void reply_state(Peer& peer, const Status& status);

    void create_peer_connection(const std::shared_ptr<Peer>& peer, const std::vector<MediaDescriptor>& media,
                                const std::vector<size_t>& selected);

    static void send_json(Peer& peer, const json_utils::json& msg);

    DispatchLoop& loop_;
    SessionManager& sessions_;
    WebRtcOptions options_;

    std::unique_ptr<rtc::WebSocketServer> ws_server_;
    std::map<SessionId, std::shared_ptr<Peer>> peers_;

    std::shared_ptr<int> alive_;
};

#endif // WEBRTC_TRANSPORT_H
