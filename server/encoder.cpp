/*
 * Encoder Factory
 */

#include "encoder.h"
#include "h264_encoder.h"
#include "vp8_encoder.h"
#include "opus_encoder.h"
#include "g711.h"
#include "g722_encoder.h"

std::unique_ptr<Encoder> create_encoder(CodecType codec) {
    switch (codec) {
        case CodecType::H264:
            return std::unique_ptr<Encoder>(new H264Encoder());
        case CodecType::VP8:
            return std::unique_ptr<Encoder>(new VP8Encoder());
        case CodecType::OPUS:
            return std::unique_ptr<Encoder>(new OpusAudioEncoder());
        case CodecType::PCMU:
        case CodecType::PCMA:
            return std::unique_ptr<Encoder>(new G711Encoder(codec));
        case CodecType::G722:
            return std::unique_ptr<Encoder>(new G722Encoder());
    }
    return nullptr;
}
