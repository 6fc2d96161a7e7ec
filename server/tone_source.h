/*
 * Audio Tone Source
 *
 * Wraps ToneGenerator as a FrameSource producing fixed-duration PCM frames
 * (20 ms by default). Timestamps count samples.
 */

#ifndef TONE_SOURCE_H
#define TONE_SOURCE_H

#include "frame_source.h"
#include "tone_generator.h"

class ToneSource : public FrameSource {
public:
    ToneSource(ToneWave wave, double frequency, double volume,
               int sample_rate, int channels, int frame_ms);

    std::string name() const override;
    MediaKind kind() const override { return MediaKind::Audio; }
    Timebase timebase() const override;
    int64_t frame_duration() const override { return samples_per_frame_; }
    SourceStatus next_frame(Frame& out) override;

private:
    ToneGenerator generator_;
    int samples_per_frame_;
    int64_t next_sample_ = 0;
};

#endif // TONE_SOURCE_H
