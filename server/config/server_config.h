/*
 * Server Configuration
 *
 * Process-level settings from the command line and environment. The mount
 * table itself lives in stream_config.h.
 */

#ifndef SERVER_CONFIG_H
#define SERVER_CONFIG_H

#include <string>
#include <vector>

namespace server_config {

// Debug flags read by the media and transport code. Set once at startup by
// ServerConfig::apply_debug_flags(), before any thread starts.
extern bool g_debug_media;       // Encoder init, keyframes, source errors
extern bool g_debug_session;     // Session state transitions, queue drops
extern bool g_debug_transport;   // WebRTC/ICE/signaling, UDP sends
extern bool g_debug_perf;        // Periodic pipeline statistics

// Static RTP destination: "/test=127.0.0.1:5004"
struct UdpSink {
    std::string path;
    std::string host;
    int port = 0;
};

/**
 * Parse "PATH=HOST:PORT"
 * @return false if malformed
 */
bool parse_udp_sink(const std::string& text, UdpSink& out);

struct ServerConfig {
    // Stream table (empty = built-in /test and /test2)
    std::string config_path;

    // WebRTC transport
    bool enable_webrtc = true;
    int signaling_port = 8554;
    bool enable_stun = false;
    std::string stun_server = "stun:stun.l.google.com:19302";

    // UDP transport
    std::vector<UdpSink> udp_sinks;
    std::string sdp_dir;             // Write <mount>.sdp per sink if set

    // Overrides for the stream file (0 / false = keep file value)
    int mtu = 0;
    int queue_size = 0;
    bool eager_start = false;

    // Scheduling
    int encoder_threads = 0;         // 0 = encode on the dispatch loop
    int max_frames_in_flight = 2;    // Per media chain when offloading
    int teardown_timeout_ms = 2000;

    // Print the mount table and exit
    bool list_only = false;

    // Debug flags
    bool debug_media = false;
    bool debug_session = false;
    bool debug_transport = false;
    bool debug_perf = false;

    /**
     * Parse command-line arguments
     * Exits on --help or invalid arguments.
     */
    void parse_command_line(int argc, char* argv[]);

    /**
     * Load configuration from environment variables
     * Checks TESTSRC_DEBUG_* variables
     */
    void load_from_env();

    /**
     * Copy the debug flags into the process-wide g_debug_* switches
     */
    void apply_debug_flags() const;

    /**
     * Print configuration summary
     */
    void print_summary() const;

private:
    void print_usage(const char* program_name) const;
};

} // namespace server_config

#endif // SERVER_CONFIG_H
