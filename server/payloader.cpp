/*
 * RTP Payloaders Implementation
 */

#include "payloader.h"
#include "h264_nal.h"
#include <algorithm>

Payloader::Payloader(const MediaDescriptor& desc, size_t max_payload,
                     uint16_t initial_sequence, uint32_t initial_timestamp)
    : desc_(desc)
    , max_payload_(max_payload < 16 ? 16 : max_payload)
    , next_sequence_(initial_sequence)
    , initial_timestamp_(initial_timestamp)
{}

uint32_t Payloader::rtp_timestamp(int64_t pts, const Timebase& tb) const {
    uint64_t ticks = pts > 0 ? static_cast<uint64_t>(pts) : 0;
    return initial_timestamp_ + static_cast<uint32_t>(rescale_ticks(ticks, tb, desc_.clock_rate));
}

void Payloader::payload(const EncodedUnit& unit, std::vector<Packet>& out) {
    std::vector<std::vector<uint8_t>> payloads;
    fragment(unit, payloads);
    if (payloads.empty()) {
        return;
    }

    const uint32_t timestamp = rtp_timestamp(unit.pts, unit.timebase);
    for (size_t i = 0; i < payloads.size(); i++) {
        Packet pkt;
        pkt.sequence = next_sequence_++;
        pkt.timestamp = timestamp;
        pkt.marker = (i + 1 == payloads.size());
        pkt.payload_type = desc_.payload_type;
        pkt.payload = std::make_shared<const std::vector<uint8_t>>(std::move(payloads[i]));
        out.push_back(std::move(pkt));
        packets_out_++;
    }
}

void H264Payloader::fragment(const EncodedUnit& unit, std::vector<std::vector<uint8_t>>& payloads) {
    std::vector<h264::NalRef> nals = h264::split_annexb(unit.data.data(), unit.data.size());

    for (const auto& ref : nals) {
        const uint8_t* nal = unit.data.data() + ref.offset;

        // Single NAL unit packet
        if (ref.size <= max_payload_) {
            payloads.emplace_back(nal, nal + ref.size);
            continue;
        }

        // FU-A: indicator keeps F and NRI, header carries the original type
        const uint8_t indicator = (nal[0] & 0xE0) | h264::NAL_FU_A;
        const uint8_t type = nal[0] & 0x1F;
        const size_t chunk_max = max_payload_ - 2;

        size_t offset = 1;  // Original NAL header is not sent
        while (offset < ref.size) {
            size_t chunk = std::min(chunk_max, ref.size - offset);
            bool start = (offset == 1);
            bool end = (offset + chunk == ref.size);

            std::vector<uint8_t> p;
            p.reserve(chunk + 2);
            p.push_back(indicator);
            p.push_back(static_cast<uint8_t>((start ? 0x80 : 0) | (end ? 0x40 : 0) | type));
            p.insert(p.end(), nal + offset, nal + offset + chunk);
            payloads.push_back(std::move(p));

            offset += chunk;
        }
    }
}

void Vp8Payloader::fragment(const EncodedUnit& unit, std::vector<std::vector<uint8_t>>& payloads) {
    // VP8 payload descriptor: 4 bytes with extended picture ID
    // Byte 0: X=1, R=0, N=0, S=start, PartID=0
    // Byte 1 (X ext): I=1, L=0, T=0, K=0
    // Byte 2-3: M=1 + 15-bit PictureID
    const size_t VP8_DESC_SIZE = 4;
    const size_t chunk_max = max_payload_ - VP8_DESC_SIZE;

    size_t offset = 0;
    bool first = true;
    while (offset < unit.data.size()) {
        size_t chunk = std::min(chunk_max, unit.data.size() - offset);

        std::vector<uint8_t> p(VP8_DESC_SIZE + chunk);
        p[0] = 0x80 | (first ? 0x10 : 0x00);
        p[1] = 0x80;
        p[2] = 0x80 | ((picture_id_ >> 8) & 0x7F);
        p[3] = picture_id_ & 0xFF;
        std::copy(unit.data.begin() + offset, unit.data.begin() + offset + chunk, p.begin() + VP8_DESC_SIZE);
        payloads.push_back(std::move(p));

        offset += chunk;
        first = false;
    }

    picture_id_ = (picture_id_ + 1) & 0x7FFF;
}

void AudioPayloader::fragment(const EncodedUnit& unit, std::vector<std::vector<uint8_t>>& payloads) {
    // Audio frames are far below the MTU; split only if a unit ever exceeds it
    size_t offset = 0;
    while (offset < unit.data.size()) {
        size_t chunk = std::min(max_payload_, unit.data.size() - offset);
        payloads.emplace_back(unit.data.begin() + offset, unit.data.begin() + offset + chunk);
        offset += chunk;
    }
}

std::unique_ptr<Payloader> create_payloader(const MediaDescriptor& desc, size_t max_payload,
                                            uint16_t initial_sequence, uint32_t initial_timestamp) {
    switch (desc.codec) {
        case CodecType::H264:
            return std::unique_ptr<Payloader>(
                new H264Payloader(desc, max_payload, initial_sequence, initial_timestamp));
        case CodecType::VP8:
            return std::unique_ptr<Payloader>(
                new Vp8Payloader(desc, max_payload, initial_sequence, initial_timestamp));
        case CodecType::OPUS:
        case CodecType::PCMU:
        case CodecType::PCMA:
        case CodecType::G722:
            return std::unique_ptr<Payloader>(
                new AudioPayloader(desc, max_payload, initial_sequence, initial_timestamp));
    }
    return nullptr;
}
