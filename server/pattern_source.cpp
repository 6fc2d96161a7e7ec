/*
 * Video Test Pattern Source Implementation
 */

#include "pattern_source.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <libyuv.h>

namespace {

struct PatternName {
    VideoPattern pattern;
    const char* name;
};

const PatternName kPatternNames[] = {
    {VideoPattern::SMPTE,     "smpte"},
    {VideoPattern::Ball,      "ball"},
    {VideoPattern::Snow,      "snow"},
    {VideoPattern::Black,     "black"},
    {VideoPattern::White,     "white"},
    {VideoPattern::Red,       "red"},
    {VideoPattern::Green,     "green"},
    {VideoPattern::Blue,      "blue"},
    {VideoPattern::Checkers1, "checkers-1"},
    {VideoPattern::Checkers2, "checkers-2"},
    {VideoPattern::Checkers4, "checkers-4"},
    {VideoPattern::Checkers8, "checkers-8"},
    {VideoPattern::Circular,  "circular"},
    {VideoPattern::Blink,     "blink"},
    {VideoPattern::Gradient,  "gradient"},
};

inline void put_pixel(uint8_t* bgra, int width, int x, int y, uint8_t r, uint8_t g, uint8_t b) {
    uint8_t* p = bgra + (static_cast<size_t>(y) * width + x) * 4;
    p[0] = b;
    p[1] = g;
    p[2] = r;
    p[3] = 255;
}

// Seven-segment layout, bit 0 = a (top) ... bit 6 = g (middle)
const uint8_t kSegments[10] = {
    0x3F, 0x06, 0x5B, 0x4F, 0x66, 0x6D, 0x7D, 0x07, 0x7F, 0x6F
};

} // namespace

const char* video_pattern_name(VideoPattern pattern) {
    for (const auto& entry : kPatternNames) {
        if (entry.pattern == pattern) return entry.name;
    }
    return "unknown";
}

bool parse_video_pattern(const std::string& name, VideoPattern& out) {
    for (const auto& entry : kPatternNames) {
        if (name == entry.name) {
            out = entry.pattern;
            return true;
        }
    }
    return false;
}

PatternSource::PatternSource(VideoPattern pattern, int width, int height,
                             uint32_t fps_num, uint32_t fps_den, bool overlay)
    : pattern_(pattern)
    , width_(width)
    , height_(height)
    , fps_num_(fps_num)
    , fps_den_(fps_den)
    , overlay_(overlay)
{
    bgra_buffer_.resize(static_cast<size_t>(width_) * height_ * 4);
}

std::string PatternSource::name() const {
    return std::string("pattern:") + video_pattern_name(pattern_);
}

Timebase PatternSource::timebase() const {
    Timebase tb;
    tb.num = fps_den_;
    tb.den = fps_num_;
    return tb;
}

SourceStatus PatternSource::next_frame(Frame& out) {
    const int64_t index = frame_index_++;

    render_bgra(index, bgra_buffer_.data());

    const size_t y_size = static_cast<size_t>(width_) * height_;
    const size_t uv_size = static_cast<size_t>(width_ / 2) * (height_ / 2);

    out.kind = MediaKind::Video;
    out.pts = index;
    out.timebase = timebase();
    out.duration = 1;
    out.flags = index == 0 ? FRAME_FLAG_DISCONT : FRAME_FLAG_NONE;
    out.width = width_;
    out.height = height_;
    out.data.resize(y_size + 2 * uv_size);

    uint8_t* y = out.data.data();
    uint8_t* u = y + y_size;
    uint8_t* v = u + uv_size;

    // BGRA bytes = libyuv "ARGB"
    int rv = libyuv::ARGBToI420(
        bgra_buffer_.data(), width_ * 4,
        y, width_,
        u, width_ / 2,
        v, width_ / 2,
        width_, height_
    );
    if (rv != 0) {
        last_error_ = "I420 conversion failed";
        return SourceStatus::Unavailable;
    }

    return SourceStatus::Ok;
}

void PatternSource::render_bgra(int64_t index, uint8_t* bgra) const {
    switch (pattern_) {
        case VideoPattern::SMPTE:     render_smpte(bgra); break;
        case VideoPattern::Ball:      render_ball(index, bgra); break;
        case VideoPattern::Snow:      render_snow(index, bgra); break;
        case VideoPattern::Black:     render_solid(0, 0, 0, bgra); break;
        case VideoPattern::White:     render_solid(255, 255, 255, bgra); break;
        case VideoPattern::Red:       render_solid(255, 0, 0, bgra); break;
        case VideoPattern::Green:     render_solid(0, 255, 0, bgra); break;
        case VideoPattern::Blue:      render_solid(0, 0, 255, bgra); break;
        case VideoPattern::Checkers1: render_checkers(1, bgra); break;
        case VideoPattern::Checkers2: render_checkers(2, bgra); break;
        case VideoPattern::Checkers4: render_checkers(4, bgra); break;
        case VideoPattern::Checkers8: render_checkers(8, bgra); break;
        case VideoPattern::Circular:  render_circular(bgra); break;
        case VideoPattern::Blink:
            if (index % 2 == 0) render_solid(255, 255, 255, bgra);
            else render_solid(0, 0, 0, bgra);
            break;
        case VideoPattern::Gradient:  render_gradient(index, bgra); break;
    }

    if (overlay_) {
        draw_counter(index, bgra);
    }
}

void PatternSource::render_solid(uint8_t r, uint8_t g, uint8_t b, uint8_t* bgra) const {
    for (int y = 0; y < height_; y++) {
        for (int x = 0; x < width_; x++) {
            put_pixel(bgra, width_, x, y, r, g, b);
        }
    }
}

void PatternSource::render_smpte(uint8_t* bgra) const {
    // 75% bars, reverse castellations, then -I / white / +Q / black
    static const uint8_t bars[7][3] = {
        {191, 191, 191}, {191, 191, 0}, {0, 191, 191}, {0, 191, 0},
        {191, 0, 191}, {191, 0, 0}, {0, 0, 191}
    };
    static const uint8_t castellations[7][3] = {
        {0, 0, 191}, {19, 19, 19}, {191, 0, 191}, {19, 19, 19},
        {0, 191, 191}, {19, 19, 19}, {191, 191, 191}
    };
    static const uint8_t bottom[4][3] = {
        {0, 33, 76}, {255, 255, 255}, {50, 0, 106}, {19, 19, 19}
    };

    const int top_end = height_ * 2 / 3;
    const int mid_end = height_ * 3 / 4;

    for (int y = 0; y < height_; y++) {
        for (int x = 0; x < width_; x++) {
            const uint8_t* c;
            if (y < top_end) {
                c = bars[x * 7 / width_];
            } else if (y < mid_end) {
                c = castellations[x * 7 / width_];
            } else {
                // -I, white and +Q each take 5/28 of the width
                int pos = x * 28 / width_;
                c = bottom[pos < 15 ? pos / 5 : 3];
            }
            put_pixel(bgra, width_, x, y, c[0], c[1], c[2]);
        }
    }
}

void PatternSource::render_ball(int64_t index, uint8_t* bgra) const {
    render_solid(0, 0, 0, bgra);

    const int radius = std::max(2, std::min(width_, height_) / 10);
    const double t = static_cast<double>(index % 3600) * 0.05;
    const double cx = width_ / 2.0 + (width_ / 2.0 - radius) * std::cos(t);
    const double cy = height_ / 2.0 + (height_ / 2.0 - radius) * std::sin(t * 1.3);

    const int x0 = std::max(0, static_cast<int>(cx) - radius);
    const int x1 = std::min(width_ - 1, static_cast<int>(cx) + radius);
    const int y0 = std::max(0, static_cast<int>(cy) - radius);
    const int y1 = std::min(height_ - 1, static_cast<int>(cy) + radius);

    const double r2 = static_cast<double>(radius) * radius;
    for (int y = y0; y <= y1; y++) {
        for (int x = x0; x <= x1; x++) {
            double dx = x - cx;
            double dy = y - cy;
            if (dx * dx + dy * dy <= r2) {
                put_pixel(bgra, width_, x, y, 255, 255, 255);
            }
        }
    }
}

void PatternSource::render_snow(int64_t index, uint8_t* bgra) const {
    // xorshift32 seeded from the frame index
    uint32_t state = static_cast<uint32_t>(index * 2654435761u) ^ 0x9E3779B9u;
    if (state == 0) state = 1;

    for (int y = 0; y < height_; y++) {
        for (int x = 0; x < width_; x++) {
            state ^= state << 13;
            state ^= state >> 17;
            state ^= state << 5;
            uint8_t v = static_cast<uint8_t>(state >> 24);
            put_pixel(bgra, width_, x, y, v, v, v);
        }
    }
}

void PatternSource::render_checkers(int size, uint8_t* bgra) const {
    for (int y = 0; y < height_; y++) {
        for (int x = 0; x < width_; x++) {
            bool on = ((x / size) + (y / size)) % 2 == 0;
            if (on) put_pixel(bgra, width_, x, y, 0, 255, 0);
            else put_pixel(bgra, width_, x, y, 255, 0, 255);
        }
    }
}

void PatternSource::render_circular(uint8_t* bgra) const {
    const double cx = width_ / 2.0;
    const double cy = height_ / 2.0;
    const double scale = 2.0 * M_PI * 8.0 / std::max(width_, height_);

    for (int y = 0; y < height_; y++) {
        for (int x = 0; x < width_; x++) {
            double dist = std::sqrt((x - cx) * (x - cx) + (y - cy) * (y - cy));
            uint8_t v = static_cast<uint8_t>(128 + 127 * std::sin(dist * scale));
            put_pixel(bgra, width_, x, y, v, v, v);
        }
    }
}

void PatternSource::render_gradient(int64_t index, uint8_t* bgra) const {
    const uint8_t blue = static_cast<uint8_t>(128 + 127 * std::sin((index % 3600) * 0.05));

    for (int y = 0; y < height_; y++) {
        for (int x = 0; x < width_; x++) {
            int bar_x = static_cast<int>((x + index * 2) % 64);
            int bar_y = static_cast<int>((y + index) % 64);

            if (x < 2 || x >= width_ - 2 || y < 2 || y >= height_ - 2) {
                put_pixel(bgra, width_, x, y, 255, 0, 0);
            } else if (bar_x < 2 || bar_y < 2) {
                put_pixel(bgra, width_, x, y, 255, 255, 255);
            } else {
                put_pixel(bgra, width_, x, y,
                          static_cast<uint8_t>((x * 255) / width_),
                          static_cast<uint8_t>((y * 255) / height_),
                          blue);
            }
        }
    }
}

void PatternSource::draw_counter(int64_t index, uint8_t* bgra) const {
    const int digits = 6;
    const int cell_w = 14;
    const int cell_h = 22;
    const int origin_x = 8;
    const int origin_y = 8;
    const int thick = 2;

    // Backing box
    for (int y = origin_y - 4; y < origin_y + cell_h + 4; y++) {
        for (int x = origin_x - 4; x < origin_x + digits * cell_w + 4; x++) {
            if (x >= 0 && y >= 0 && x < width_ && y < height_) {
                put_pixel(bgra, width_, x, y, 0, 0, 0);
            }
        }
    }

    int64_t value = index;
    for (int i = digits - 1; i >= 0; i--) {
        const int d = static_cast<int>(value % 10);
        value /= 10;
        const uint8_t seg = kSegments[d];
        const int left = origin_x + i * cell_w;
        const int right = left + cell_w - 4;
        const int top = origin_y;
        const int mid = origin_y + cell_h / 2;
        const int bot = origin_y + cell_h - 1;

        for (int y = top; y <= bot; y++) {
            for (int x = left; x <= right; x++) {
                bool on = false;
                bool h_span = x > left + 1 && x < right - 1;
                if ((seg & 0x01) && h_span && y < top + thick) on = true;            // a
                if ((seg & 0x02) && x > right - thick && y <= mid) on = true;        // b
                if ((seg & 0x04) && x > right - thick && y >= mid) on = true;        // c
                if ((seg & 0x08) && h_span && y > bot - thick) on = true;            // d
                if ((seg & 0x10) && x < left + thick && y >= mid) on = true;         // e
                if ((seg & 0x20) && x < left + thick && y <= mid) on = true;         // f
                if ((seg & 0x40) && h_span && std::abs(y - mid) < thick / 2 + 1) on = true;  // g
                if (on && x < width_ && y < height_) {
                    put_pixel(bgra, width_, x, y, 255, 255, 255);
                }
            }
        }
    }
}
