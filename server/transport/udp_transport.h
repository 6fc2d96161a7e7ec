/*
 * UDP Sink Transport
 *
 * Static plain-RTP destinations configured at startup ("/test=host:port").
 * Each sink is one session that is set up and played immediately. Media i
 * of the mount is sent to port + 2*i (the odd port is left for RTCP).
 *
 * Sockets are non-blocking. EAGAIN parks the session's queue and arms
 * EPOLLOUT; the queue resumes when the socket becomes writable.
 */

#ifndef UDP_TRANSPORT_H
#define UDP_TRANSPORT_H

#include "transport.h"
#include "../config/server_config.h"
#include "../dispatch_loop.h"
#include "../session_manager.h"
#include "../status.h"
#include <map>
#include <string>
#include <sys/socket.h>

class UdpTransport : public Transport {
public:
    UdpTransport(DispatchLoop& loop, SessionManager& sessions);
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    /**
     * Open a sink and start playing its mount
     * @param sdp_dir Write <mount>.sdp here if not empty
     */
    Status add_sink(const server_config::UdpSink& sink, const std::string& sdp_dir);

    // Close every sink socket
    void stop();

    size_t sink_count() const { return sinks_.size(); }

    const char* name() const override { return "udp"; }
    SendResult send(SessionId session, size_t media_index, const Packet& packet, uint32_t ssrc) override;
    void close_session(SessionId session) override;

private:
    struct Sink {
        SessionId session = 0;
        server_config::UdpSink cfg;
        int fd = -1;
        struct sockaddr_storage addr;
        socklen_t addr_len = 0;
        bool want_writable = false;
    };

    void on_socket_event(SessionId session, uint32_t events);
    void close_sink(Sink& sink);
    Status write_sdp(const Sink& sink, const std::string& sdp_dir);

    DispatchLoop& loop_;
    SessionManager& sessions_;
    std::map<SessionId, Sink> sinks_;
};

#endif // UDP_TRANSPORT_H
