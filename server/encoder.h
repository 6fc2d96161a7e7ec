/*
 * Encoder Abstraction
 *
 * One encoder instance per media chain. Encoders are driven frame by frame
 * and may emit zero or more units per frame. Keyframe placement is decided
 * by the caller (EncoderStage) through the force_keyframe argument so that
 * the interval is counted in frames, not wall-clock time.
 */

#ifndef ENCODER_H
#define ENCODER_H

#include "media_types.h"
#include <memory>
#include <string>
#include <vector>

struct EncoderParams {
    CodecType codec = CodecType::H264;

    // Video
    int width = 0;
    int height = 0;
    uint32_t fps_num = 30;
    uint32_t fps_den = 1;

    // Audio
    int sample_rate = 8000;
    int channels = 1;
    int frame_samples = 160;   // Samples per channel per frame

    int bitrate_kbps = 2000;
    int complexity = 5;
};

class Encoder {
public:
    virtual ~Encoder() = default;

    virtual CodecType type() const = 0;

    // Codec name for display/logging
    virtual const char* name() const = 0;

    // Returns false and sets last_error() if the parameters are unusable
    virtual bool init(const EncoderParams& params) = 0;

    // Cleanup resources
    virtual void cleanup() = 0;

    // Encode one raw frame, appending output units to `out`.
    // Returns false and sets last_error() on encoder failure.
    virtual bool encode(const Frame& frame, bool force_keyframe, std::vector<EncodedUnit>& out) = 0;

    // Out-of-band decoder configuration (H.264: SPS and PPS in Annex B form),
    // available right after init. Default: codec has none.
    virtual bool decoder_config(std::vector<uint8_t>& out) { (void)out; return false; }

    const std::string& last_error() const { return last_error_; }

protected:
    std::string last_error_;
};

std::unique_ptr<Encoder> create_encoder(CodecType codec);

#endif // ENCODER_H
