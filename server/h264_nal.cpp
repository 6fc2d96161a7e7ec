/*
 * H.264 NAL Unit Helpers Implementation
 */

#include "h264_nal.h"
#include "utils/base64.h"
#include <cstdio>

namespace h264 {

namespace {

// Returns the index just past the next start code at or after `pos`,
// and the index where the start code begins in `sc_begin`.
size_t find_start_code(const uint8_t* data, size_t size, size_t pos, size_t& sc_begin) {
    for (size_t i = pos; i + 3 <= size; i++) {
        if (data[i] == 0 && data[i + 1] == 0) {
            if (data[i + 2] == 1) {
                sc_begin = (i > 0 && data[i - 1] == 0) ? i - 1 : i;
                return i + 3;
            }
        }
    }
    sc_begin = size;
    return size;
}

} // namespace

std::vector<NalRef> split_annexb(const uint8_t* data, size_t size) {
    std::vector<NalRef> nals;

    size_t sc_begin = 0;
    size_t start = find_start_code(data, size, 0, sc_begin);
    while (start < size) {
        size_t next_sc = 0;
        size_t next = find_start_code(data, size, start, next_sc);

        NalRef ref;
        ref.offset = start;
        ref.size = next_sc - start;
        if (ref.size > 0) {
            ref.type = nal_type(data[start]);
            nals.push_back(ref);
        }
        start = next;
    }
    return nals;
}

void append_annexb(std::vector<uint8_t>& out, const uint8_t* nal, size_t size) {
    static const uint8_t start_code[4] = {0, 0, 0, 1};
    out.insert(out.end(), start_code, start_code + 4);
    out.insert(out.end(), nal, nal + size);
}

std::string sprop_parameter_sets(const std::vector<uint8_t>& sps, const std::vector<uint8_t>& pps) {
    return base64::encode(sps.data(), sps.size()) + "," + base64::encode(pps.data(), pps.size());
}

namespace {

// Table A-1: MaxFS (macroblocks) and MaxMBPS per level
struct LevelLimit {
    int level_idc;
    int64_t max_fs;
    int64_t max_mbps;
};

const LevelLimit level_limits[] = {
    {31,  3600,  108000},
    {32,  5120,  216000},
    {40,  8192,  245760},
    {42,  8704,  522240},
    {50, 22080,  589824},
    {51, 36864,  983040},
    {52, 36864, 2073600},
};

} // namespace

int level_idc_for(int width, int height, uint32_t fps_num, uint32_t fps_den) {
    const int64_t mbs = static_cast<int64_t>((width + 15) / 16) * ((height + 15) / 16);
    const uint32_t den = fps_den ? fps_den : 1;
    // Macroblocks per second, rounded up
    const int64_t mbps = (mbs * fps_num + den - 1) / den;
    for (const LevelLimit& limit : level_limits) {
        if (mbs <= limit.max_fs && mbps <= limit.max_mbps) {
            return limit.level_idc;
        }
    }
    return 52;
}

std::string baseline_profile_level_id(int level_idc) {
    char buf[8];
    snprintf(buf, sizeof(buf), "42e0%02x", level_idc & 0xFF);
    return buf;
}

std::string profile_level_id(const std::vector<uint8_t>& sps) {
    if (sps.size() < 4) {
        return "42e01f";  // Constrained baseline 3.1
    }
    char buf[8];
    snprintf(buf, sizeof(buf), "%02x%02x%02x", sps[1], sps[2], sps[3]);
    return buf;
}

} // namespace h264
