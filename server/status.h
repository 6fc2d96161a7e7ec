/*
 * Error Reporting
 *
 * Runtime operations return a Status naming the error class and carrying a
 * human readable message. Configuration problems are raised as ConfigError
 * during startup, before the dispatch loop runs.
 */

#ifndef STATUS_H
#define STATUS_H

#include <stdexcept>
#include <string>
#include <utility>

enum class ErrorCode {
    Ok = 0,
    ConfigurationError,   // Bad or duplicate mount, unsupported codec combination
    NotFound,             // Unknown mount path or session id
    InvalidState,         // Verb received out of order
    SourceUnavailable,    // Frame source could not produce a frame
    EndOfStream,          // Finite source ran out
    EncoderInitFailure,   // Encoder rejected its parameters
    EncodeFailure,        // Encoder failed on a frame after init
    TransportFailure,     // Write error or disconnect
    Shutdown              // Server is stopping
};

const char* error_code_name(ErrorCode code);

struct Status {
    ErrorCode code = ErrorCode::Ok;
    std::string message;

    Status() = default;
    Status(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    static Status ok() { return Status(); }

    bool is_ok() const { return code == ErrorCode::Ok; }

    // "InvalidState: play before setup"
    std::string to_string() const;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

#endif // STATUS_H
