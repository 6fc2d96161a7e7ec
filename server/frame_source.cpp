/*
 * Frame Source Factory
 */

#include "frame_source.h"
#include "pattern_source.h"
#include "tone_source.h"
#include "file_source.h"
#include "config/stream_config.h"

std::unique_ptr<FrameSource> create_frame_source(const config::MediaConfig& media) {
    const config::SourceConfig& src = media.source;

    switch (src.type) {
        case config::SourceType::Pattern:
            return std::unique_ptr<FrameSource>(new PatternSource(
                src.pattern, src.width, src.height, src.fps_num, src.fps_den, src.overlay));

        case config::SourceType::Tone:
            return std::unique_ptr<FrameSource>(new ToneSource(
                src.wave, src.frequency, src.volume, src.sample_rate, src.channels, src.frame_ms));

        case config::SourceType::File:
            if (media.kind == MediaKind::Video) {
                return RawFileSource::video(src.file_path, src.width, src.height,
                                            src.fps_num, src.fps_den, src.loop);
            }
            return RawFileSource::audio(src.file_path, src.sample_rate, src.channels,
                                        src.frame_ms, src.loop);
    }
    return nullptr;
}
