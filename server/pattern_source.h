/*
 * Video Test Pattern Source
 *
 * Renders BGRA test patterns and converts them to I420 with libyuv.
 * Every pixel is a function of (pattern, frame index, x, y) only.
 */

#ifndef PATTERN_SOURCE_H
#define PATTERN_SOURCE_H

#include "frame_source.h"
#include <string>
#include <vector>

enum class VideoPattern {
    SMPTE,
    Ball,
    Snow,
    Black,
    White,
    Red,
    Green,
    Blue,
    Checkers1,
    Checkers2,
    Checkers4,
    Checkers8,
    Circular,
    Blink,
    Gradient
};

const char* video_pattern_name(VideoPattern pattern);
bool parse_video_pattern(const std::string& name, VideoPattern& out);

class PatternSource : public FrameSource {
public:
    PatternSource(VideoPattern pattern, int width, int height,
                  uint32_t fps_num, uint32_t fps_den, bool overlay);

    std::string name() const override;
    MediaKind kind() const override { return MediaKind::Video; }
    Timebase timebase() const override;
    int64_t frame_duration() const override { return 1; }
    SourceStatus next_frame(Frame& out) override;

    // Render frame `index` into a BGRA buffer (width * height * 4)
    void render_bgra(int64_t index, uint8_t* bgra) const;

private:
    void render_smpte(uint8_t* bgra) const;
    void render_ball(int64_t index, uint8_t* bgra) const;
    void render_snow(int64_t index, uint8_t* bgra) const;
    void render_checkers(int size, uint8_t* bgra) const;
    void render_circular(uint8_t* bgra) const;
    void render_gradient(int64_t index, uint8_t* bgra) const;
    void render_solid(uint8_t r, uint8_t g, uint8_t b, uint8_t* bgra) const;
    void draw_counter(int64_t index, uint8_t* bgra) const;

    VideoPattern pattern_;
    int width_;
    int height_;
    uint32_t fps_num_;
    uint32_t fps_den_;
    bool overlay_;
    int64_t frame_index_ = 0;

    std::vector<uint8_t> bgra_buffer_;
};

#endif // PATTERN_SOURCE_H
