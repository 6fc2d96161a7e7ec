/*
 * RTP Payloaders
 *
 * Turn encoded units into RTP packets for one media of one pipeline.
 *
 * - Sequence numbers increase by one per packet across unit boundaries and
 *   wrap at 16 bits
 * - Timestamps are initial + pts * timebase * clock_rate, computed from the
 *   absolute pts with integer arithmetic (no drift over long runs)
 * - The marker bit is set on the last packet of every unit
 *
 * Payload formats:
 * - H.264: RFC 6184 single NAL unit packets and FU-A fragments
 *   (packetization-mode=1)
 * - VP8:   RFC 7741 payload descriptor with 15-bit PictureID
 * - Audio: one unit per packet (RFC 3551 / RFC 7587)
 */

#ifndef PAYLOADER_H
#define PAYLOADER_H

#include "media_types.h"
#include <memory>
#include <vector>

class Payloader {
public:
    // max_payload: largest RTP payload in bytes (MTU minus RTP header)
    Payloader(const MediaDescriptor& desc, size_t max_payload,
              uint16_t initial_sequence, uint32_t initial_timestamp);
    virtual ~Payloader() = default;

    // Append the packets for `unit` to `out`
    void payload(const EncodedUnit& unit, std::vector<Packet>& out);

    // RTP timestamp for a pts in `tb`
    uint32_t rtp_timestamp(int64_t pts, const Timebase& tb) const;

    const MediaDescriptor& descriptor() const { return desc_; }
    uint16_t next_sequence() const { return next_sequence_; }
    size_t max_payload() const { return max_payload_; }
    uint64_t packets_out() const { return packets_out_; }

protected:
    // Split one unit into packet payloads, in send order
    virtual void fragment(const EncodedUnit& unit, std::vector<std::vector<uint8_t>>& payloads) = 0;

    MediaDescriptor desc_;
    size_t max_payload_;

private:
    uint16_t next_sequence_;
    uint32_t initial_timestamp_;
    uint64_t packets_out_ = 0;
};

class H264Payloader : public Payloader {
public:
    using Payloader::Payloader;

protected:
    void fragment(const EncodedUnit& unit, std::vector<std::vector<uint8_t>>& payloads) override;
};

class Vp8Payloader : public Payloader {
public:
    using Payloader::Payloader;

protected:
    void fragment(const EncodedUnit& unit, std::vector<std::vector<uint8_t>>& payloads) override;

private:
    uint16_t picture_id_ = 0;
};

class AudioPayloader : public Payloader {
public:
    using Payloader::Payloader;

protected:
    void fragment(const EncodedUnit& unit, std::vector<std::vector<uint8_t>>& payloads) override;
};

std::unique_ptr<Payloader> create_payloader(const MediaDescriptor& desc, size_t max_payload,
                                            uint16_t initial_sequence, uint32_t initial_timestamp);

#endif // PAYLOADER_H
