/*
 * Server Configuration Implementation
 */

#include "server_config.h"
#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <getopt.h>

namespace server_config {

bool g_debug_media = false;
bool g_debug_session = false;
bool g_debug_transport = false;
bool g_debug_perf = false;

namespace {

// Strict integer parse for option values
bool parse_int_arg(const char* arg, int lo, int hi, int& out) {
    char* end = nullptr;
    long value = strtol(arg, &end, 10);
    if (!arg[0] || *end != '\0' || value < lo || value > hi) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

void int_option(const char* name, const char* arg, int lo, int hi, int& out) {
    if (!parse_int_arg(arg, lo, hi, out)) {
        fprintf(stderr, "Invalid value for --%s: '%s' (expected %d..%d)\n", name, arg, lo, hi);
        exit(1);
    }
}

} // namespace

bool parse_udp_sink(const std::string& text, UdpSink& out) {
    size_t eq = text.find('=');
    size_t colon = text.rfind(':');
    if (eq == std::string::npos || colon == std::string::npos || colon < eq) {
        return false;
    }

    UdpSink sink;
    sink.path = text.substr(0, eq);
    sink.host = text.substr(eq + 1, colon - eq - 1);
    if (sink.path.empty() || sink.path[0] != '/' || sink.host.empty()) {
        return false;
    }
    if (!parse_int_arg(text.c_str() + colon + 1, 1, 65533, sink.port)) {
        return false;
    }

    out = sink;
    return true;
}

void ServerConfig::parse_command_line(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"help",             no_argument,       0, 'h'},
        {"config",           required_argument, 0, 'c'},
        {"signaling-port",   required_argument, 0, 's'},
        {"udp-sink",         required_argument, 0, 'u'},
        {"list",             no_argument,       0, 'l'},
        {"no-webrtc",        no_argument,       0,  0 },
        {"sdp-dir",          required_argument, 0,  0 },
        {"mtu",              required_argument, 0,  0 },
        {"queue-size",       required_argument, 0,  0 },
        {"encoder-threads",  required_argument, 0,  0 },
        {"max-in-flight",    required_argument, 0,  0 },
        {"eager",            no_argument,       0,  0 },
        {"teardown-timeout", required_argument, 0,  0 },
        {"enable-stun",      no_argument,       0,  0 },
        {"stun-server",      required_argument, 0,  0 },
        {"debug-media",      no_argument,       0,  0 },
        {"debug-session",    no_argument,       0,  0 },
        {"debug-transport",  no_argument,       0,  0 },
        {"debug-perf",       no_argument,       0,  0 },
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "hc:s:u:l", long_options, &option_index)) != -1) {
        switch (c) {
            case 0: {
                // Long option
                const char* name = long_options[option_index].name;
                if (strcmp(name, "no-webrtc") == 0) {
                    enable_webrtc = false;
                } else if (strcmp(name, "sdp-dir") == 0) {
                    sdp_dir = optarg;
                } else if (strcmp(name, "mtu") == 0) {
                    int_option(name, optarg, 256, 65000, mtu);
                } else if (strcmp(name, "queue-size") == 0) {
                    int_option(name, optarg, 1, 1 << 20, queue_size);
                } else if (strcmp(name, "encoder-threads") == 0) {
                    int_option(name, optarg, 0, 64, encoder_threads);
                } else if (strcmp(name, "max-in-flight") == 0) {
                    int_option(name, optarg, 1, 64, max_frames_in_flight);
                } else if (strcmp(name, "eager") == 0) {
                    eager_start = true;
                } else if (strcmp(name, "teardown-timeout") == 0) {
                    int_option(name, optarg, 0, 60000, teardown_timeout_ms);
                } else if (strcmp(name, "enable-stun") == 0) {
                    enable_stun = true;
                } else if (strcmp(name, "stun-server") == 0) {
                    stun_server = optarg;
                    enable_stun = true;
                } else if (strcmp(name, "debug-media") == 0) {
                    debug_media = true;
                } else if (strcmp(name, "debug-session") == 0) {
                    debug_session = true;
                } else if (strcmp(name, "debug-transport") == 0) {
                    debug_transport = true;
                } else if (strcmp(name, "debug-perf") == 0) {
                    debug_perf = true;
                }
                break;
            }

            case 'h':
                print_usage(argv[0]);
                exit(0);

            case 'c':
                config_path = optarg;
                break;

            case 's':
                int_option("signaling-port", optarg, 1, 65535, signaling_port);
                break;

            case 'u': {
                UdpSink sink;
                if (!parse_udp_sink(optarg, sink)) {
                    fprintf(stderr, "Invalid --udp-sink '%s' (expected /path=host:port)\n", optarg);
                    exit(1);
                }
                udp_sinks.push_back(sink);
                break;
            }

            case 'l':
                list_only = true;
                break;

            case '?':
                // Error message already printed by getopt_long
                exit(1);

            default:
                fprintf(stderr, "Unknown option\n");
                exit(1);
        }
    }

    if (optind < argc) {
        fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        exit(1);
    }
}

void ServerConfig::load_from_env() {
    // Debug flags from environment
    if (getenv("TESTSRC_DEBUG_MEDIA")) {
        debug_media = true;
    }
    if (getenv("TESTSRC_DEBUG_SESSION")) {
        debug_session = true;
    }
    if (getenv("TESTSRC_DEBUG_TRANSPORT")) {
        debug_transport = true;
    }
    if (getenv("TESTSRC_DEBUG_PERF")) {
        debug_perf = true;
    }
}

void ServerConfig::apply_debug_flags() const {
    g_debug_media = debug_media;
    g_debug_session = debug_session;
    g_debug_transport = debug_transport;
    g_debug_perf = debug_perf;
}

void ServerConfig::print_summary() const {
    fprintf(stderr, "\n=== rtsp-testsrc server ===\n");
    fprintf(stderr, "Stream config:    %s\n", config_path.empty() ? "(built-in)" : config_path.c_str());
    if (enable_webrtc) {
        fprintf(stderr, "Signaling:        ws://0.0.0.0:%d\n", signaling_port);
        fprintf(stderr, "STUN:             %s\n", enable_stun ? stun_server.c_str() : "disabled");
    } else {
        fprintf(stderr, "Signaling:        disabled\n");
    }
    for (const auto& sink : udp_sinks) {
        fprintf(stderr, "UDP sink:         %s -> %s:%d\n", sink.path.c_str(), sink.host.c_str(), sink.port);
    }
    if (!sdp_dir.empty()) {
        fprintf(stderr, "SDP directory:    %s\n", sdp_dir.c_str());
    }
    if (encoder_threads > 0) {
        fprintf(stderr, "Encoder threads:  %d (max %d frames in flight per media)\n",
                encoder_threads, max_frames_in_flight);
    } else {
        fprintf(stderr, "Encoder threads:  none (encode on dispatch loop)\n");
    }
    fprintf(stderr, "Teardown timeout: %d ms\n", teardown_timeout_ms);

    // Show active debug flags
    bool any_debug = debug_media || debug_session || debug_transport || debug_perf;
    if (any_debug) {
        fprintf(stderr, "\nDebug flags:\n");
        if (debug_media)      fprintf(stderr, "  - Media (sources/encoders)\n");
        if (debug_session)    fprintf(stderr, "  - Session (state/queues)\n");
        if (debug_transport)  fprintf(stderr, "  - Transport (WebRTC/UDP)\n");
        if (debug_perf)       fprintf(stderr, "  - Performance (stats)\n");
    }

    fprintf(stderr, "\n");
}

void ServerConfig::print_usage(const char* program_name) const {
    fprintf(stderr, "Usage: %s [options]\n\n", program_name);
    fprintf(stderr, "Options:\n");
    fprintf(stderr, "  -h, --help                 Show this help\n");
    fprintf(stderr, "  -c, --config FILE          JSON stream table (default: built-in /test, /test2)\n");
    fprintf(stderr, "  -s, --signaling-port PORT  WebSocket signaling port (default: %d)\n", signaling_port);
    fprintf(stderr, "      --no-webrtc            Disable the WebRTC transport\n");
    fprintf(stderr, "  -u, --udp-sink P=HOST:PORT Send mount P as plain RTP (repeatable)\n");
    fprintf(stderr, "      --sdp-dir DIR          Write an SDP file per UDP sink\n");
    fprintf(stderr, "      --mtu BYTES            Max RTP packet size\n");
    fprintf(stderr, "      --queue-size N         Per-session packet queue bound\n");
    fprintf(stderr, "      --encoder-threads N    Encode on N worker threads (default: 0)\n");
    fprintf(stderr, "      --max-in-flight N      Frames in flight per media (default: %d)\n", max_frames_in_flight);
    fprintf(stderr, "      --eager                Start shared pipelines at startup\n");
    fprintf(stderr, "      --teardown-timeout MS  Wait for transport close (default: %d)\n", teardown_timeout_ms);
    fprintf(stderr, "      --enable-stun          Enable STUN for remote connections\n");
    fprintf(stderr, "      --stun-server URL      STUN server URL (default: %s)\n", stun_server.c_str());
    fprintf(stderr, "  -l, --list                 Print the mount table and exit\n");
    fprintf(stderr, "      --debug-media          Source/encoder logs\n");
    fprintf(stderr, "      --debug-session        Session state logs\n");
    fprintf(stderr, "      --debug-transport      WebRTC/UDP logs\n");
    fprintf(stderr, "      --debug-perf           Periodic statistics\n");
    fprintf(stderr, "\nEnvironment variables:\n");
    fprintf(stderr, "  TESTSRC_DEBUG_MEDIA        Same as --debug-media\n");
    fprintf(stderr, "  TESTSRC_DEBUG_SESSION      Same as --debug-session\n");
    fprintf(stderr, "  TESTSRC_DEBUG_TRANSPORT    Same as --debug-transport\n");
    fprintf(stderr, "  TESTSRC_DEBUG_PERF         Same as --debug-perf\n");
    fprintf(stderr, "\n");
}

} // namespace server_config
