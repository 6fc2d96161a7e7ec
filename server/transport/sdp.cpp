/*
 * SDP Rendering Implementation
 */

#include "sdp.h"
#include "../h264_nal.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <sstream>

namespace sdp {

std::string render(const SdpSession& session) {
    const bool ipv6 = session.dest_host.find(':') != std::string::npos;
    const char* addr_type = ipv6 ? "IP6" : "IP4";

    std::ostringstream out;
    out << "v=0\r\n";
    out << "o=- " << static_cast<unsigned long>(time(nullptr)) << " 1 IN " << addr_type << " "
        << (ipv6 ? "::1" : "127.0.0.1") << "\r\n";
    out << "s=" << (session.name.empty() ? "rtsp-testsrc" : session.name) << "\r\n";
    out << "c=IN " << addr_type << " " << session.dest_host << "\r\n";
    out << "t=0 0\r\n";

    for (const auto& media : session.media) {
        const MediaDescriptor& desc = media.desc;
        const unsigned pt = desc.payload_type;

        out << "m=" << media_kind_name(desc.kind) << " " << media.port << " RTP/AVP " << pt << "\r\n";
        out << "a=rtpmap:" << pt << " " << desc.rtpmap() << "\r\n";

        std::string fmtp;
        if (desc.codec == CodecType::H264 && !media.sps.empty()) {
            // The encoder's SPS is authoritative for profile and level
            MediaDescriptor actual = desc;
            actual.params["profile-level-id"] = h264::profile_level_id(media.sps);
            fmtp = actual.fmtp();
        } else {
            fmtp = desc.fmtp();
        }
        if (desc.codec == CodecType::H264 && !media.sps.empty() && !media.pps.empty()) {
            if (!fmtp.empty()) {
                fmtp += ";";
            }
            fmtp += "sprop-parameter-sets=" + h264::sprop_parameter_sets(media.sps, media.pps);
        }
        if (!fmtp.empty()) {
            out << "a=fmtp:" << pt << " " << fmtp << "\r\n";
        }
        if (media.ssrc) {
            out << "a=ssrc:" << media.ssrc << " cname:rtsp-testsrc\r\n";
        }
        out << "a=sendonly\r\n";
    }
    return out.str();
}

bool write_file(const std::string& path, const std::string& content, std::string& error) {
    FILE* f = fopen(path.c_str(), "w");
    if (!f) {
        error = path + ": " + strerror(errno);
        return false;
    }
    size_t written = fwrite(content.data(), 1, content.size(), f);
    bool ok = written == content.size();
    if (fclose(f) != 0) {
        ok = false;
    }
    if (!ok) {
        error = path + ": write failed";
    }
    return ok;
}

std::string file_name_for_path(const std::string& mount_path) {
    std::string name;
    for (char c : mount_path) {
        if (c == '/') {
            if (!name.empty()) {
                name += '_';
            }
        } else {
            name += c;
        }
    }
    if (!name.empty() && name.back() == '_') {
        name.pop_back();
    }
    return (name.empty() ? "root" : name) + ".sdp";
}

} // namespace sdp
