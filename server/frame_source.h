/*
 * Frame Source Abstraction
 *
 * A source produces timestamped raw frames, one per call, at the rate given
 * by frame_duration() in its own timebase. Synthetic sources are pure
 * functions of the frame index so runs are reproducible.
 */

#ifndef FRAME_SOURCE_H
#define FRAME_SOURCE_H

#include "media_types.h"
#include <memory>
#include <string>

namespace config {
struct MediaConfig;
}

enum class SourceStatus {
    Ok,
    EndOfStream,
    Unavailable
};

class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Source name for logging ("pattern:ball", "tone:sine", "file:/tmp/x.yuv")
    virtual std::string name() const = 0;

    virtual MediaKind kind() const = 0;

    // Tick duration of pts values
    virtual Timebase timebase() const = 0;

    // Duration of one frame in timebase ticks
    virtual int64_t frame_duration() const = 0;

    // Open device/file; synthetic sources always succeed
    virtual bool open() { return true; }

    // Produce the next frame. On Unavailable, last_error() says why.
    virtual SourceStatus next_frame(Frame& out) = 0;

    const std::string& last_error() const { return last_error_; }

protected:
    std::string last_error_;
};

// Build the source described by a media config entry
std::unique_ptr<FrameSource> create_frame_source(const config::MediaConfig& media);

#endif // FRAME_SOURCE_H
