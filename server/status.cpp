/*
 * Error Reporting Implementation
 */

#include "status.h"

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                 return "Ok";
        case ErrorCode::ConfigurationError: return "ConfigurationError";
        case ErrorCode::NotFound:           return "NotFound";
        case ErrorCode::InvalidState:       return "InvalidState";
        case ErrorCode::SourceUnavailable:  return "SourceUnavailable";
        case ErrorCode::EndOfStream:        return "EndOfStream";
        case ErrorCode::EncoderInitFailure: return "EncoderInitFailure";
        case ErrorCode::EncodeFailure:      return "EncodeFailure";
        case ErrorCode::TransportFailure:   return "TransportFailure";
        case ErrorCode::Shutdown:           return "Shutdown";
    }
    return "Unknown";
}

std::string Status::to_string() const {
    if (message.empty()) {
        return error_code_name(code);
    }
    return std::string(error_code_name(code)) + ": " + message;
}
