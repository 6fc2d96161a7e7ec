/*
 * Media Server Implementation
 */

#include "media_server.h"
#include <cstdio>

namespace {

const int64_t STATS_INTERVAL_US = 5 * 1000000;

} // namespace

MediaServer::MediaServer(const server_config::ServerConfig& config)
    : config_(config)
{}

MediaServer::~MediaServer() {
    stop();
}

void MediaServer::configure() {
    streams_ = config_.config_path.empty() ? config::default_streams()
                                           : config::load_streams(config_.config_path);

    // Command line overrides
    if (config_.mtu > 0) {
        streams_.mtu = config_.mtu;
    }
    if (config_.queue_size > 0) {
        streams_.queue_size = static_cast<size_t>(config_.queue_size);
    }
    if (config_.eager_start) {
        streams_.eager_start = true;
    }

    registry_.load(streams_);
    registry_.seal();

    for (const auto& sink : config_.udp_sinks) {
        if (!registry_.lookup(sink.path)) {
            throw ConfigError("--udp-sink: no stream at " + sink.path);
        }
    }
}

bool MediaServer::start() {
    if (!loop_.init()) {
        return false;
    }

    if (config_.encoder_threads > 0) {
        pool_.reset(new WorkerPool(static_cast<size_t>(config_.encoder_threads)));
    }

    SessionManagerOptions options;
    options.queue_size = streams_.queue_size;
    options.teardown_timeout_ms = config_.teardown_timeout_ms;
    options.eager_start = streams_.eager_start;
    options.pipeline.mtu = static_cast<size_t>(streams_.mtu);
    options.pipeline.pool = pool_.get();
    options.pipeline.max_in_flight = config_.max_frames_in_flight;
    sessions_.reset(new SessionManager(registry_, loop_, options));

    sessions_->start_eager();

    if (config_.enable_webrtc) {
        WebRtcOptions webrtc_options;
        webrtc_options.signaling_port = config_.signaling_port;
        webrtc_options.enable_stun = config_.enable_stun;
        webrtc_options.stun_server = config_.stun_server;
        webrtc_.reset(new WebRtcTransport(loop_, *sessions_, webrtc_options));
        if (!webrtc_->init()) {
            return false;
        }
    }

    if (!config_.udp_sinks.empty()) {
        udp_.reset(new UdpTransport(loop_, *sessions_));
        for (const auto& sink : config_.udp_sinks) {
            Status status = udp_->add_sink(sink, config_.sdp_dir);
            if (!status.is_ok()) {
                fprintf(stderr, "[UDP] Sink %s=%s:%d failed: %s\n", sink.path.c_str(), sink.host.c_str(),
                        sink.port, status.to_string().c_str());
            }
        }
    }

    if (server_config::g_debug_perf) {
        schedule_stats();
    }

    started_ = true;
    fprintf(stderr, "Server: Ready\n");
    return true;
}

void MediaServer::run(const CancellationToken& token) {
    loop_.run(token);
}

void MediaServer::stop() {
    if (!sessions_) {
        return;
    }

    if (stats_timer_) {
        loop_.cancel_timer(stats_timer_);
        stats_timer_ = 0;
    }

    if (started_) {
        fprintf(stderr, "Server: Shutting down %zu session(s)...\n", sessions_->session_count());
    }
    sessions_->shutdown();

    // Transports confirm closure through the loop; the teardown timeout
    // bounds the wait
    const int64_t wait_us = static_cast<int64_t>(config_.teardown_timeout_ms) * 1000 + 100000;
    if (!loop_.run_until_done([this]() { return sessions_->idle(); }, wait_us)) {
        fprintf(stderr, "Server: %zu session(s) did not close in time\n", sessions_->session_count());
    }

    if (webrtc_) {
        webrtc_->stop();
    }
    if (udp_) {
        udp_->stop();
    }

    // Encoder threads finish their queued frames; completions are dropped
    if (pool_) {
        pool_->shutdown();
    }

    webrtc_.reset();
    udp_.reset();
    sessions_.reset();
    pool_.reset();
    started_ = false;
    fprintf(stderr, "Server: Stopped\n");
}

void MediaServer::schedule_stats() {
    stats_timer_ = loop_.schedule_after(STATS_INTERVAL_US, [this]() {
        stats_timer_ = 0;
        sessions_->print_stats();
        if (pool_) {
            fprintf(stderr, "[Server] encoder pool: %zu workers, %zu queued\n",
                    pool_->num_workers(), pool_->pending_tasks());
        }
        if (webrtc_) {
            fprintf(stderr, "[Server] WebRTC peers: %zu\n", webrtc_->peer_count());
        }
        if (udp_) {
            fprintf(stderr, "[Server] UDP sinks: %zu\n", udp_->sink_count());
        }
        schedule_stats();
    });
}
