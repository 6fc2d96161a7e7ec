/*
 * H.264 NAL Unit Helpers
 *
 * Annex B byte stream scanning (00 00 01 / 00 00 00 01 start codes).
 */

#ifndef H264_NAL_H
#define H264_NAL_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace h264 {

enum NalType : uint8_t {
    NAL_SLICE = 1,
    NAL_IDR = 5,
    NAL_SEI = 6,
    NAL_SPS = 7,
    NAL_PPS = 8,
    NAL_AUD = 9,
    NAL_FU_A = 28
};

// Location of one NAL unit (without its start code) inside a buffer
struct NalRef {
    size_t offset = 0;
    size_t size = 0;
    uint8_t type = 0;
};

// Split an Annex B access unit into NAL units. Data before the first start
// code is ignored.
std::vector<NalRef> split_annexb(const uint8_t* data, size_t size);

inline uint8_t nal_type(uint8_t header) { return header & 0x1F; }

// Append `nal` with a 4-byte start code
void append_annexb(std::vector<uint8_t>& out, const uint8_t* nal, size_t size);

// "sprop-parameter-sets" value: base64(SPS),base64(PPS)
std::string sprop_parameter_sets(const std::vector<uint8_t>& sps, const std::vector<uint8_t>& pps);

// "profile-level-id" value from the first three bytes after the SPS header
std::string profile_level_id(const std::vector<uint8_t>& sps);

// Lowest level (level_idc, 31 or above) whose frame size and macroblock
// rate limits cover the given format
int level_idc_for(int width, int height, uint32_t fps_num, uint32_t fps_den);

// Constrained baseline "profile-level-id" for a level_idc, e.g. 31 -> "42e01f"
std::string baseline_profile_level_id(int level_idc);

} // namespace h264

#endif // H264_NAL_H
