/*
 * Audio Configuration - Centralized audio settings
 *
 * Defaults for tone sources and the Opus encoder. Per-stream values in the
 * stream file override the ones that have a config field.
 */

#ifndef AUDIO_CONFIG_H
#define AUDIO_CONFIG_H

// ============================================================================
// Core Audio Format
// ============================================================================

// Frame duration in milliseconds
// Opus supports: 2.5, 5, 10, 20, 40, 60ms
// 20ms is standard for VoIP/RTP (160 samples at 8kHz)
#define AUDIO_FRAME_DURATION_MS 20

// ============================================================================
// Opus Encoder Settings
// ============================================================================

// RTP clock rate for Opus is always 48000, whatever the input rate (RFC 7587)
#define OPUS_RTP_CLOCK_RATE     48000

// Largest packet opus_encode may produce
#define OPUS_MAX_PACKET_BYTES   4000

// Opus signal type
// Test tones are closer to music than speech
#define OPUS_SIGNAL_TYPE        OPUS_SIGNAL_MUSIC

// Variable bitrate mode
// 1 = VBR enabled (better quality)
// 0 = CBR (constant bitrate)
#define OPUS_VBR                1

// Discontinuous Transmission (silence suppression)
// 0 = disabled: silence still produces one packet per frame, so packet
//     timing stays regular for the silence wave
#define OPUS_DTX                0

// Forward Error Correction for packet loss
#define OPUS_INBAND_FEC         1

// Expected packet loss percentage (0-100)
// Used to tune FEC aggressiveness
#define OPUS_PACKET_LOSS_PERC   1

// ============================================================================
// G.722
// ============================================================================

// G.722 samples at 16kHz but its RTP clock is 8000 (RFC 3551 section 4.5.2)
#define G722_SAMPLE_RATE        16000
#define G722_RTP_CLOCK_RATE     8000

// 64 kbit/s mode: 6 bits lower band, 2 bits upper band per output byte
#define G722_BIT_RATE           64000

#endif // AUDIO_CONFIG_H
