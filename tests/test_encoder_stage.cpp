/*
 * Encoder stage tests: keyframe cadence, parameter set policy and
 * keyframe requests with the real H.264 and VP8 encoders.
 */

#include "test_util.h"
#include "../server/encoder_stage.h"
#include "../server/h264_nal.h"
#include "../server/pattern_source.h"
#include "../server/utils/base64.h"
#include <stdexcept>

static const int W = 128;
static const int H = 96;

static EncoderParams video_params(CodecType codec) {
    EncoderParams params;
    params.codec = codec;
    params.width = W;
    params.height = H;
    params.fps_num = 30;
    params.fps_den = 1;
    params.bitrate_kbps = 500;
    return params;
}

static bool has_nal(const EncodedUnit& unit, uint8_t type) {
    for (const auto& nal : h264::split_annexb(unit.data.data(), unit.data.size())) {
        if (nal.type == type) return true;
    }
    return false;
}

// Encode `count` frames, collecting every unit
static std::vector<EncodedUnit> run_stage(EncoderStage& stage, PatternSource& src, int count) {
    std::vector<EncodedUnit> units;
    for (int i = 0; i < count; i++) {
        Frame f;
        CHECK(src.next_frame(f) == SourceStatus::Ok);
        Status status = stage.encode(f, units);
        CHECK(status.is_ok());
    }
    return units;
}

static void test_split_annexb() {
    const uint8_t stream[] = {
        0x00, 0x00, 0x00, 0x01, 0x67, 0x42, 0xC0, 0x1F,   // SPS (4-byte start code)
        0x00, 0x00, 0x01, 0x68, 0xCE,                     // PPS (3-byte start code)
        0x00, 0x00, 0x00, 0x01, 0x65, 0x88, 0x84, 0x00, 0x10  // IDR
    };
    std::vector<h264::NalRef> nals = h264::split_annexb(stream, sizeof(stream));
    CHECK_EQ(nals.size(), 3);
    CHECK_EQ(nals[0].type, h264::NAL_SPS);
    CHECK_EQ(nals[0].offset, 4);
    CHECK_EQ(nals[0].size, 4);
    CHECK_EQ(nals[1].type, h264::NAL_PPS);
    CHECK_EQ(nals[1].size, 2);
    CHECK_EQ(nals[2].type, h264::NAL_IDR);
    CHECK_EQ(nals[2].size, 5);

    std::vector<uint8_t> sps(stream + 4, stream + 8);
    std::vector<uint8_t> pps(stream + 11, stream + 13);
    CHECK(h264::profile_level_id(sps) == "42c01f");
    CHECK(h264::sprop_parameter_sets(sps, pps) == "Z0LAHw==,aM4=");

    // No start code at all
    const uint8_t junk[] = {0x01, 0x02, 0x03};
    CHECK(h264::split_annexb(junk, sizeof(junk)).empty());
}

static void test_level_selection() {
    CHECK_EQ(h264::level_idc_for(160, 120, 30, 1), 31);
    CHECK_EQ(h264::level_idc_for(640, 480, 60, 1), 31);
    CHECK_EQ(h264::level_idc_for(1280, 720, 30, 1), 31);
    CHECK_EQ(h264::level_idc_for(1280, 720, 60, 1), 32);
    CHECK_EQ(h264::level_idc_for(1920, 1080, 30, 1), 40);
    CHECK_EQ(h264::level_idc_for(1920, 1080, 60, 1), 42);
    CHECK_EQ(h264::level_idc_for(3840, 2160, 30, 1), 51);
    CHECK_EQ(h264::level_idc_for(3840, 2160, 60, 1), 52);

    CHECK(h264::baseline_profile_level_id(31) == "42e01f");
    CHECK(h264::baseline_profile_level_id(40) == "42e028");
}

static void test_base64() {
    const uint8_t data[] = {'M', 'a', 'n'};
    CHECK(base64::encode(data, 3) == "TWFu");
    CHECK(base64::encode(data, 2) == "TWE=");
    CHECK(base64::encode(data, 1) == "TQ==");
    CHECK(base64::encode(data, 0).empty());
}

static void test_h264_keyframe_interval() {
    config::EncoderConfig cfg;
    cfg.keyframe_interval = 5;
    cfg.repeat_parameter_sets = true;
    EncoderStage stage(CodecType::H264, cfg, create_encoder(CodecType::H264));
    CHECK(stage.init(video_params(CodecType::H264)).is_ok());

    PatternSource src(VideoPattern::Ball, W, H, 30, 1, true);
    std::vector<EncodedUnit> units = run_stage(stage, src, 12);
    CHECK_EQ(units.size(), 12);

    for (size_t i = 0; i < units.size(); i++) {
        bool expect_key = (i % 5) == 0;
        CHECK_EQ(units[i].is_keyframe, expect_key);
        if (units[i].is_keyframe) {
            // Inline SPS and PPS on every keyframe
            CHECK(units[i].has_parameter_sets);
            CHECK(has_nal(units[i], h264::NAL_SPS));
            CHECK(has_nal(units[i], h264::NAL_PPS));
            CHECK(has_nal(units[i], h264::NAL_IDR));
        }
        CHECK_EQ(units[i].pts, static_cast<int64_t>(i));
    }
    CHECK_EQ(stage.keyframes_out(), 3);
    CHECK_EQ(stage.frames_in(), 12);
}

static void test_h264_out_of_band_parameter_sets() {
    config::EncoderConfig cfg;
    cfg.keyframe_interval = 4;
    cfg.repeat_parameter_sets = false;
    EncoderStage stage(CodecType::H264, cfg, create_encoder(CodecType::H264));
    CHECK(stage.init(video_params(CodecType::H264)).is_ok());

    // Published before the first frame
    std::vector<uint8_t> sps, pps;
    CHECK(stage.parameter_sets(sps, pps));
    CHECK(!sps.empty());
    CHECK(!pps.empty());
    CHECK_EQ(h264::nal_type(sps[0]), h264::NAL_SPS);

    PatternSource src(VideoPattern::SMPTE, W, H, 30, 1, false);
    std::vector<EncodedUnit> units = run_stage(stage, src, 8);
    CHECK_EQ(units.size(), 8);
    for (const auto& unit : units) {
        CHECK(!has_nal(unit, h264::NAL_SPS));
        CHECK(!has_nal(unit, h264::NAL_PPS));
        CHECK(!unit.has_parameter_sets);
    }
    CHECK(units[0].is_keyframe);
    CHECK(units[4].is_keyframe);
}

static void test_h264_keyframe_request() {
    config::EncoderConfig cfg;
    cfg.keyframe_interval = 100;
    EncoderStage stage(CodecType::H264, cfg, create_encoder(CodecType::H264));
    CHECK(stage.init(video_params(CodecType::H264)).is_ok());

    PatternSource src(VideoPattern::Ball, W, H, 30, 1, false);
    std::vector<EncodedUnit> units = run_stage(stage, src, 3);
    CHECK(units[0].is_keyframe);
    CHECK(!units[1].is_keyframe);
    CHECK(!units[2].is_keyframe);

    stage.request_keyframe();
    std::vector<EncodedUnit> more = run_stage(stage, src, 2);
    CHECK_EQ(more.size(), 2);
    CHECK(more[0].is_keyframe);
    CHECK(!more[1].is_keyframe);
}

static void test_h264_frame_mismatch() {
    config::EncoderConfig cfg;
    EncoderStage stage(CodecType::H264, cfg, create_encoder(CodecType::H264));
    CHECK(stage.init(video_params(CodecType::H264)).is_ok());

    PatternSource wrong(VideoPattern::Black, W * 2, H, 30, 1, false);
    Frame f;
    CHECK(wrong.next_frame(f) == SourceStatus::Ok);
    std::vector<EncodedUnit> units;
    Status status = stage.encode(f, units);
    CHECK(status.code == ErrorCode::EncodeFailure);
    CHECK(units.empty());
}

static void test_vp8_keyframe_interval() {
    config::EncoderConfig cfg;
    cfg.keyframe_interval = 3;
    EncoderStage stage(CodecType::VP8, cfg, create_encoder(CodecType::VP8));
    CHECK(stage.init(video_params(CodecType::VP8)).is_ok());

    PatternSource src(VideoPattern::Gradient, W, H, 30, 1, false);
    std::vector<EncodedUnit> units = run_stage(stage, src, 7);
    CHECK_EQ(units.size(), 7);
    for (size_t i = 0; i < units.size(); i++) {
        CHECK_EQ(units[i].is_keyframe, (i % 3) == 0);
        CHECK(!units[i].data.empty());
    }

    std::vector<uint8_t> sps, pps;
    CHECK(!stage.parameter_sets(sps, pps));
}

static void test_missing_encoder() {
    config::EncoderConfig cfg;
    EncoderStage stage(CodecType::H264, cfg, std::unique_ptr<Encoder>());
    Status status = stage.init(video_params(CodecType::H264));
    CHECK(status.code == ErrorCode::EncoderInitFailure);
}

// Encoder whose library call throws after emitting a partial unit
class ThrowingEncoder : public Encoder {
public:
    CodecType type() const override { return CodecType::PCMU; }
    const char* name() const override { return "throwing"; }
    bool init(const EncoderParams& params) override { (void)params; return true; }
    void cleanup() override {}
    bool encode(const Frame& frame, bool force_keyframe, std::vector<EncodedUnit>& out) override {
        (void)force_keyframe;
        EncodedUnit unit;
        unit.pts = frame.pts;
        out.push_back(unit);
        throw std::runtime_error("codec state corrupted");
    }
};

static void test_encoder_exception_is_encode_failure() {
    config::EncoderConfig cfg;
    EncoderStage stage(CodecType::PCMU, cfg, std::unique_ptr<Encoder>(new ThrowingEncoder()));
    EncoderParams params;
    params.codec = CodecType::PCMU;
    params.sample_rate = 8000;
    params.channels = 1;
    params.frame_samples = 160;
    CHECK(stage.init(params).is_ok());

    Frame f;
    f.kind = MediaKind::Audio;
    f.samples = 160;
    f.channels = 1;
    f.data.assign(160 * sizeof(int16_t), 0);
    std::vector<EncodedUnit> units(1);
    Status status = stage.encode(f, units);
    CHECK(status.code == ErrorCode::EncodeFailure);
    CHECK(status.message.find("codec state corrupted") != std::string::npos);
    CHECK_EQ(units.size(), 1);
}

int main() {
    RUN_TEST(test_split_annexb);
    RUN_TEST(test_level_selection);
    RUN_TEST(test_base64);
    RUN_TEST(test_h264_keyframe_interval);
    RUN_TEST(test_h264_out_of_band_parameter_sets);
    RUN_TEST(test_h264_keyframe_request);
    RUN_TEST(test_h264_frame_mismatch);
    RUN_TEST(test_vp8_keyframe_interval);
    RUN_TEST(test_missing_encoder);
    RUN_TEST(test_encoder_exception_is_encode_failure);
    return test_summary("test_encoder_stage");
}
