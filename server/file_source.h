/*
 * Raw File Source
 *
 * Reads headerless raw media from a file: I420 frames for video, interleaved
 * S16 native-endian PCM for audio. Stands in for an external capture device:
 * a missing file or short read reports Unavailable, end of file reports
 * EndOfStream unless looping.
 */

#ifndef FILE_SOURCE_H
#define FILE_SOURCE_H

#include "frame_source.h"
#include <cstdio>
#include <string>

class RawFileSource : public FrameSource {
public:
    // Video: width/height/fps; audio: sample_rate/channels/frame_ms
    static std::unique_ptr<RawFileSource> video(const std::string& path, int width, int height,
                                                uint32_t fps_num, uint32_t fps_den, bool loop);
    static std::unique_ptr<RawFileSource> audio(const std::string& path, int sample_rate,
                                                int channels, int frame_ms, bool loop);

    ~RawFileSource() override;

    std::string name() const override { return "file:" + path_; }
    MediaKind kind() const override { return kind_; }
    Timebase timebase() const override { return timebase_; }
    int64_t frame_duration() const override { return duration_; }
    bool open() override;
    SourceStatus next_frame(Frame& out) override;

private:
    RawFileSource(const std::string& path, MediaKind kind, size_t frame_bytes,
                  Timebase timebase, int64_t duration, bool loop);

    std::string path_;
    MediaKind kind_;
    size_t frame_bytes_;
    Timebase timebase_;
    int64_t duration_;
    bool loop_;

    FILE* file_ = nullptr;
    int64_t next_pts_ = 0;
    bool discont_ = true;

    // Video
    int width_ = 0;
    int height_ = 0;

    // Audio
    int sample_rate_ = 0;
    int channels_ = 0;
};

#endif // FILE_SOURCE_H
