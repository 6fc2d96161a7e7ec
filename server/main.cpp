/*
 * rtsp-testsrc server
 *
 * Serves synthetic and file-backed test streams under named mount paths
 * over WebRTC (WebSocket signaling) and static UDP RTP sinks.
 */

#include "media_server.h"
#include "status.h"
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <pthread.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

int main(int argc, char* argv[]) {
    // Parse configuration from environment and command line
    server_config::ServerConfig config;
    config.load_from_env();
    config.parse_command_line(argc, argv);
    config.apply_debug_flags();

    MediaServer server(config);
    try {
        server.configure();
    } catch (const ConfigError& e) {
        fprintf(stderr, "Configuration error: %s\n", e.what());
        return 1;
    }

    if (config.list_only) {
        server.registry().print_table();
        return 0;
    }

    config.print_summary();
    server.registry().print_table();

    // Route SIGINT/SIGTERM to a signalfd. Blocked before any thread starts so
    // every thread inherits the mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        fprintf(stderr, "Failed to block signals\n");
        return 1;
    }
    signal(SIGPIPE, SIG_IGN);

    int sig_fd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (sig_fd < 0) {
        fprintf(stderr, "Failed to create signalfd: %s\n", strerror(errno));
        return 1;
    }

    if (!server.start()) {
        fprintf(stderr, "Failed to start server\n");
        server.stop();
        close(sig_fd);
        return 1;
    }

    CancellationSource stop_source;
    bool watching = server.loop().add_fd(sig_fd, EPOLLIN, [sig_fd, &stop_source](uint32_t) {
        struct signalfd_siginfo info;
        while (read(sig_fd, &info, sizeof(info)) == sizeof(info)) {
            fprintf(stderr, "\nServer: Received signal %u, shutting down...\n", info.ssi_signo);
            stop_source.cancel();
        }
    });
    if (!watching) {
        server.stop();
        close(sig_fd);
        return 1;
    }

    server.run(stop_source.token());

    server.loop().remove_fd(sig_fd);
    close(sig_fd);
    server.stop();
    return 0;
}
