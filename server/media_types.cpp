/*
 * Media Data Model Implementation
 */

#include "media_types.h"
#include <algorithm>

uint64_t rescale_ticks(uint64_t ticks, const Timebase& tb, uint64_t rate) {
    // ticks * num * rate / den, split into whole and remainder parts so the
    // intermediate products stay well inside 64 bits for long runs
    const uint64_t den = tb.den ? tb.den : 1;
    const uint64_t whole = ticks / den;
    const uint64_t rem = ticks % den;
    return whole * tb.num * rate + (rem * tb.num * rate) / den;
}

std::vector<uint8_t> Packet::serialize(uint32_t ssrc) const {
    std::vector<uint8_t> out(RTP_HEADER_SIZE + payload_size());

    out[0] = 0x80;  // V=2, P=0, X=0, CC=0
    out[1] = static_cast<uint8_t>((marker ? 0x80 : 0x00) | (payload_type & 0x7F));
    out[2] = static_cast<uint8_t>(sequence >> 8);
    out[3] = static_cast<uint8_t>(sequence & 0xFF);
    out[4] = static_cast<uint8_t>(timestamp >> 24);
    out[5] = static_cast<uint8_t>(timestamp >> 16);
    out[6] = static_cast<uint8_t>(timestamp >> 8);
    out[7] = static_cast<uint8_t>(timestamp);
    out[8] = static_cast<uint8_t>(ssrc >> 24);
    out[9] = static_cast<uint8_t>(ssrc >> 16);
    out[10] = static_cast<uint8_t>(ssrc >> 8);
    out[11] = static_cast<uint8_t>(ssrc);

    if (payload && !payload->empty()) {
        std::copy(payload->begin(), payload->end(), out.begin() + RTP_HEADER_SIZE);
    }
    return out;
}

std::string MediaDescriptor::rtpmap() const {
    std::string s = std::string(codec_encoding_name(codec)) + "/" + std::to_string(clock_rate);
    if (kind == MediaKind::Audio && (codec == CodecType::OPUS || channels > 1)) {
        s += "/" + std::to_string(codec == CodecType::OPUS ? 2 : channels);
    }
    return s;
}

std::string MediaDescriptor::fmtp() const {
    std::string s;
    for (const auto& kv : params) {
        if (!s.empty()) s += ";";
        s += kv.first + "=" + kv.second;
    }
    return s;
}

std::vector<size_t> select_best_media(const std::vector<MediaDescriptor>& media) {
    int best_video = -1;
    int best_audio = -1;
    for (size_t i = 0; i < media.size(); i++) {
        const MediaDescriptor& m = media[i];
        int& best = m.kind == MediaKind::Video ? best_video : best_audio;
        if (best < 0) {
            best = static_cast<int>(i);
            continue;
        }
        const MediaDescriptor& current = media[best];
        if (m.kind == MediaKind::Video) {
            const int64_t area = static_cast<int64_t>(m.width) * m.height;
            const int64_t best_area = static_cast<int64_t>(current.width) * current.height;
            if (area != best_area) {
                if (area > best_area) best = static_cast<int>(i);
                continue;
            }
        }
        if (codec_priority(m.codec) < codec_priority(current.codec)) {
            best = static_cast<int>(i);
        }
    }

    std::vector<size_t> selected;
    for (size_t i = 0; i < media.size(); i++) {
        if (static_cast<int>(i) == best_video || static_cast<int>(i) == best_audio) {
            selected.push_back(i);
        }
    }
    return selected;
}
