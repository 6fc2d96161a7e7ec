/*
 * Media Server
 *
 * Owns everything a running server needs: the mount registry, the dispatch
 * loop, the encoder pool, the session manager and the transports.
 *
 * Lifecycle:
 *   configure()  load the stream table, register and seal the mounts
 *   start()      loop, pool, eager pipelines, transports
 *   run()        dispatch until cancelled
 *   stop()       tear down sessions, wait for transport closure, release
 */

#ifndef MEDIA_SERVER_H
#define MEDIA_SERVER_H

#include "cancellation.h"
#include "config/server_config.h"
#include "config/stream_config.h"
#include "dispatch_loop.h"
#include "session_manager.h"
#include "stream_registry.h"
#include "worker_pool.h"
#include "transport/udp_transport.h"
#include "transport/webrtc_transport.h"
#include <memory>

class MediaServer {
public:
    explicit MediaServer(const server_config::ServerConfig& config);
    ~MediaServer();

    MediaServer(const MediaServer&) = delete;
    MediaServer& operator=(const MediaServer&) = delete;

    /**
     * Load and register the mount table
     * @throws ConfigError on any invalid stream entry
     */
    void configure();

    // Returns false if a transport could not start
    bool start();

    void run(const CancellationToken& token);

    void stop();

    const StreamRegistry& registry() const { return registry_; }
    const config::StreamsConfig& streams() const { return streams_; }
    DispatchLoop& loop() { return loop_; }
    SessionManager* sessions() { return sessions_.get(); }

private:
    void schedule_stats();

    server_config::ServerConfig config_;
    config::StreamsConfig streams_;
    StreamRegistry registry_;
    DispatchLoop loop_;

    std::unique_ptr<WorkerPool> pool_;
    std::unique_ptr<SessionManager> sessions_;
    std::unique_ptr<UdpTransport> udp_;
    std::unique_ptr<WebRtcTransport> webrtc_;

    DispatchLoop::TimerId stats_timer_ = 0;
    bool started_ = false;
};

#endif // MEDIA_SERVER_H
