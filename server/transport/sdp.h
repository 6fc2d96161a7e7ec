/*
 * SDP Rendering
 *
 * Session descriptions for plain RTP receivers (ffplay, VLC, GStreamer
 * sdpdemux). One m= line per media; H.264 media carry
 * sprop-parameter-sets when the parameter sets are known.
 */

#ifndef SDP_H
#define SDP_H

#include "../media_types.h"
#include <string>
#include <vector>

namespace sdp {

struct SdpMedia {
    MediaDescriptor desc;
    int port = 0;
    uint32_t ssrc = 0;
    std::vector<uint8_t> sps;   // H.264 only, without start code
    std::vector<uint8_t> pps;
};

struct SdpSession {
    std::string name;           // s= line
    std::string dest_host;      // c= line
    std::vector<SdpMedia> media;
};

// Render with CRLF line endings
std::string render(const SdpSession& session);

/**
 * Write an SDP file
 * @return false on I/O error (error describes it)
 */
bool write_file(const std::string& path, const std::string& content, std::string& error);

// "/test" -> "test.sdp", "/a/b" -> "a_b.sdp"
std::string file_name_for_path(const std::string& mount_path);

} // namespace sdp

#endif // SDP_H
