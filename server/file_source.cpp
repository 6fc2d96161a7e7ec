/*
 * Raw File Source Implementation
 */

#include "file_source.h"
#include <cerrno>
#include <cstring>

std::unique_ptr<RawFileSource> RawFileSource::video(const std::string& path, int width, int height,
                                                    uint32_t fps_num, uint32_t fps_den, bool loop) {
    Timebase tb;
    tb.num = fps_den;
    tb.den = fps_num;
    size_t frame_bytes = static_cast<size_t>(width) * height * 3 / 2;
    std::unique_ptr<RawFileSource> src(new RawFileSource(path, MediaKind::Video, frame_bytes, tb, 1, loop));
    src->width_ = width;
    src->height_ = height;
    return src;
}

std::unique_ptr<RawFileSource> RawFileSource::audio(const std::string& path, int sample_rate,
                                                    int channels, int frame_ms, bool loop) {
    Timebase tb;
    tb.num = 1;
    tb.den = static_cast<uint32_t>(sample_rate);
    int samples = sample_rate * frame_ms / 1000;
    size_t frame_bytes = static_cast<size_t>(samples) * channels * sizeof(int16_t);
    std::unique_ptr<RawFileSource> src(new RawFileSource(path, MediaKind::Audio, frame_bytes, tb, samples, loop));
    src->sample_rate_ = sample_rate;
    src->channels_ = channels;
    return src;
}

RawFileSource::RawFileSource(const std::string& path, MediaKind kind, size_t frame_bytes,
                             Timebase timebase, int64_t duration, bool loop)
    : path_(path)
    , kind_(kind)
    , frame_bytes_(frame_bytes)
    , timebase_(timebase)
    , duration_(duration)
    , loop_(loop)
{}

RawFileSource::~RawFileSource() {
    if (file_) {
        fclose(file_);
        file_ = nullptr;
    }
}

bool RawFileSource::open() {
    if (file_) return true;

    file_ = fopen(path_.c_str(), "rb");
    if (!file_) {
        last_error_ = "cannot open " + path_ + ": " + strerror(errno);
        return false;
    }
    return true;
}

SourceStatus RawFileSource::next_frame(Frame& out) {
    if (!file_ && !open()) {
        return SourceStatus::Unavailable;
    }

    out.data.resize(frame_bytes_);
    size_t got = fread(out.data.data(), 1, frame_bytes_, file_);

    if (got == 0 && feof(file_)) {
        if (!loop_) {
            return SourceStatus::EndOfStream;
        }
        rewind(file_);
        discont_ = true;
        got = fread(out.data.data(), 1, frame_bytes_, file_);
    }

    if (got != frame_bytes_) {
        if (ferror(file_)) {
            last_error_ = "read error on " + path_ + ": " + strerror(errno);
        } else {
            last_error_ = "short frame in " + path_ + " (" + std::to_string(got) + " of " +
                          std::to_string(frame_bytes_) + " bytes)";
        }
        return SourceStatus::Unavailable;
    }

    out.kind = kind_;
    out.pts = next_pts_;
    out.timebase = timebase_;
    out.duration = duration_;
    out.flags = discont_ ? FRAME_FLAG_DISCONT : FRAME_FLAG_NONE;
    out.width = width_;
    out.height = height_;
    out.sample_rate = sample_rate_;
    out.channels = channels_;
    out.samples = kind_ == MediaKind::Audio ? static_cast<int>(duration_) : 0;

    discont_ = false;
    next_pts_ += duration_;
    return SourceStatus::Ok;
}
