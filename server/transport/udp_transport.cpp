/*
 * UDP Sink Transport Implementation
 */

#include "udp_transport.h"
#include "sdp.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <unistd.h>

namespace {

bool resolve(const std::string& host, struct sockaddr_storage& addr, socklen_t& len, std::string& error) {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;

    struct addrinfo* result = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || !result) {
        error = host + ": " + gai_strerror(rc);
        return false;
    }
    memcpy(&addr, result->ai_addr, result->ai_addrlen);
    len = result->ai_addrlen;
    freeaddrinfo(result);
    return true;
}

void set_port(struct sockaddr_storage& addr, int port) {
    if (addr.ss_family == AF_INET6) {
        reinterpret_cast<struct sockaddr_in6*>(&addr)->sin6_port = htons(static_cast<uint16_t>(port));
    } else {
        reinterpret_cast<struct sockaddr_in*>(&addr)->sin_port = htons(static_cast<uint16_t>(port));
    }
}

} // namespace

UdpTransport::UdpTransport(DispatchLoop& loop, SessionManager& sessions)
    : loop_(loop)
    , sessions_(sessions)
{}

UdpTransport::~UdpTransport() {
    stop();
}

Status UdpTransport::add_sink(const server_config::UdpSink& cfg, const std::string& sdp_dir) {
    std::vector<MediaDescriptor> media;
    Status status = sessions_.describe(cfg.path, media);
    if (!status.is_ok()) {
        return status;
    }
    if (cfg.port + 2 * static_cast<int>(media.size() - 1) > 65535) {
        return Status(ErrorCode::ConfigurationError,
                      "sink port " + std::to_string(cfg.port) + " leaves no room for " +
                      std::to_string(media.size()) + " media");
    }

    Sink sink;
    sink.cfg = cfg;
    std::string error;
    if (!resolve(cfg.host, sink.addr, sink.addr_len, error)) {
        return Status(ErrorCode::TransportFailure, error);
    }

    sink.fd = socket(sink.addr.ss_family, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (sink.fd < 0) {
        return Status(ErrorCode::TransportFailure, std::string("socket: ") + strerror(errno));
    }

    SessionId id = sessions_.open_session(this);
    sink.session = id;
    sinks_[id] = sink;

    if (!loop_.add_fd(sink.fd, 0, [this, id](uint32_t events) { on_socket_event(id, events); })) {
        sessions_.on_transport_failure(id, "cannot watch socket");
        return Status(ErrorCode::TransportFailure, "cannot add UDP socket to loop");
    }

    status = sessions_.on_setup(id, cfg.path);
    if (!status.is_ok()) {
        sessions_.on_teardown(id);
        return status;
    }

    if (!sdp_dir.empty()) {
        Status sdp_status = write_sdp(sinks_[id], sdp_dir);
        if (!sdp_status.is_ok()) {
            // Streaming still works without the file
            fprintf(stderr, "[UDP] %s\n", sdp_status.to_string().c_str());
        }
    }

    status = sessions_.on_play(id);
    if (!status.is_ok()) {
        sessions_.on_teardown(id);
        return status;
    }

    fprintf(stderr, "[UDP] %s -> %s:%d (%zu media, session %llu)\n", cfg.path.c_str(),
            cfg.host.c_str(), cfg.port, media.size(), (unsigned long long)id);
    return Status::ok();
}

void UdpTransport::stop() {
    for (auto& kv : sinks_) {
        close_sink(kv.second);
    }
    sinks_.clear();
}

SendResult UdpTransport::send(SessionId session, size_t media_index, const Packet& packet, uint32_t ssrc) {
    auto it = sinks_.find(session);
    if (it == sinks_.end() || it->second.fd < 0) {
        return SendResult::Failed;
    }
    Sink& sink = it->second;

    std::vector<uint8_t> datagram = packet.serialize(ssrc);
    struct sockaddr_storage addr = sink.addr;
    set_port(addr, sink.cfg.port + 2 * static_cast<int>(media_index));

    ssize_t n = sendto(sink.fd, datagram.data(), datagram.size(), 0,
                       reinterpret_cast<const struct sockaddr*>(&addr), sink.addr_len);
    if (n >= 0) {
        return SendResult::Sent;
    }

    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS) {
        if (!sink.want_writable && loop_.modify_fd(sink.fd, EPOLLOUT)) {
            sink.want_writable = true;
        }
        return SendResult::WouldBlock;
    }

    // Nobody listening yet: report and keep going
    if (errno == ECONNREFUSED) {
        if (server_config::g_debug_transport) {
            fprintf(stderr, "[UDP] %s: %s:%d refused\n", sink.cfg.path.c_str(), sink.cfg.host.c_str(),
                    sink.cfg.port + 2 * static_cast<int>(media_index));
        }
        return SendResult::Sent;
    }

    fprintf(stderr, "[UDP] %s: sendto failed: %s\n", sink.cfg.path.c_str(), strerror(errno));
    return SendResult::Failed;
}

void UdpTransport::close_session(SessionId session) {
    auto it = sinks_.find(session);
    if (it != sinks_.end()) {
        close_sink(it->second);
        sinks_.erase(it);
    }
    sessions_.on_transport_closed(session);
}

void UdpTransport::on_socket_event(SessionId session, uint32_t events) {
    auto it = sinks_.find(session);
    if (it == sinks_.end()) {
        return;
    }
    Sink& sink = it->second;

    if (events & EPOLLERR) {
        // Pending ICMP error from an earlier datagram
        int err = 0;
        socklen_t len = sizeof(err);
        if (getsockopt(sink.fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err != 0 &&
            server_config::g_debug_transport) {
            fprintf(stderr, "[UDP] %s: socket error: %s\n", sink.cfg.path.c_str(), strerror(err));
        }
    }

    if ((events & EPOLLOUT) && sink.want_writable) {
        sink.want_writable = false;
        loop_.modify_fd(sink.fd, 0);
        sessions_.on_transport_writable(session);
    }
}

void UdpTransport::close_sink(Sink& sink) {
    if (sink.fd >= 0) {
        loop_.remove_fd(sink.fd);
        close(sink.fd);
        sink.fd = -1;
    }
}

Status UdpTransport::write_sdp(const Sink& sink, const std::string& sdp_dir) {
    SessionInfo info;
    if (!sessions_.session_info(sink.session, info)) {
        return Status(ErrorCode::NotFound, "no session for " + sink.cfg.path);
    }
    std::vector<MediaDescriptor> media;
    Status status = sessions_.describe(sink.cfg.path, media);
    if (!status.is_ok()) {
        return status;
    }

    sdp::SdpSession session;
    session.name = sink.cfg.path;
    session.dest_host = sink.cfg.host;
    for (size_t i = 0; i < media.size(); i++) {
        sdp::SdpMedia m;
        m.desc = media[i];
        m.port = sink.cfg.port + 2 * static_cast<int>(i);
        m.ssrc = i < info.ssrc.size() ? info.ssrc[i] : 0;
        if (media[i].codec == CodecType::H264) {
            sessions_.parameter_sets(sink.session, i, m.sps, m.pps);
        }
        session.media.push_back(m);
    }

    std::string path = sdp_dir + "/" + sdp::file_name_for_path(sink.cfg.path);
    std::string error;
    if (!sdp::write_file(path, sdp::render(session), error)) {
        return Status(ErrorCode::TransportFailure, "cannot write SDP " + error);
    }
    fprintf(stderr, "[UDP] Wrote %s\n", path.c_str());
    return Status::ok();
}
