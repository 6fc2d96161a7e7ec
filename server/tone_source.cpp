/*
 * Audio Tone Source Implementation
 */

#include "tone_source.h"
#include <cstring>

namespace {

struct WaveName {
    ToneWave wave;
    const char* name;
};

const WaveName kWaveNames[] = {
    {ToneWave::Sine,       "sine"},
    {ToneWave::Square,     "square"},
    {ToneWave::Saw,        "saw"},
    {ToneWave::Triangle,   "triangle"},
    {ToneWave::Silence,    "silence"},
    {ToneWave::WhiteNoise, "white-noise"},
    {ToneWave::Ticks,      "ticks"},
};

} // namespace

const char* tone_wave_name(ToneWave wave) {
    for (const auto& entry : kWaveNames) {
        if (entry.wave == wave) return entry.name;
    }
    return "unknown";
}

bool parse_tone_wave(const std::string& name, ToneWave& out) {
    for (const auto& entry : kWaveNames) {
        if (name == entry.name) {
            out = entry.wave;
            return true;
        }
    }
    return false;
}

int16_t ToneGenerator::sample_at(int64_t n) const {
    const double amplitude = 32767.0 * volume_;

    // Phase in cycles, reduced to [0, 1) using the exact period in samples
    // where possible so the result does not depend on how far into the run we are
    auto cycle_phase = [this](int64_t index) {
        double cycles = static_cast<double>(index % sample_rate_) * frequency_ / sample_rate_;
        double whole_seconds = static_cast<double>(index / sample_rate_) * frequency_;
        double phase = cycles + (whole_seconds - std::floor(whole_seconds));
        return phase - std::floor(phase);
    };

    double value = 0.0;
    switch (wave_) {
        case ToneWave::Sine:
            value = std::sin(2.0 * M_PI * cycle_phase(n));
            break;
        case ToneWave::Square:
            value = cycle_phase(n) < 0.5 ? 1.0 : -1.0;
            break;
        case ToneWave::Saw:
            value = 2.0 * cycle_phase(n) - 1.0;
            break;
        case ToneWave::Triangle: {
            double p = cycle_phase(n);
            value = p < 0.5 ? 4.0 * p - 1.0 : 3.0 - 4.0 * p;
            break;
        }
        case ToneWave::Silence:
            value = 0.0;
            break;
        case ToneWave::WhiteNoise: {
            // splitmix64 of the sample index
            uint64_t z = static_cast<uint64_t>(n) + 0x9E3779B97F4A7C15ull;
            z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
            z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
            z = z ^ (z >> 31);
            value = static_cast<double>(z >> 11) / static_cast<double>(1ull << 53) * 2.0 - 1.0;
            break;
        }
        case ToneWave::Ticks: {
            // 100 ms beep at the top of each second
            int64_t in_second = n % sample_rate_;
            if (in_second < sample_rate_ / 10) {
                value = std::sin(2.0 * M_PI * cycle_phase(n));
            }
            break;
        }
    }

    return static_cast<int16_t>(value * amplitude);
}

ToneSource::ToneSource(ToneWave wave, double frequency, double volume,
                       int sample_rate, int channels, int frame_ms)
    : generator_(sample_rate, channels)
    , samples_per_frame_(sample_rate * frame_ms / 1000)
{
    generator_.set_wave(wave);
    generator_.set_frequency(frequency);
    generator_.set_volume(volume);
}

std::string ToneSource::name() const {
    return std::string("tone:") + tone_wave_name(generator_.get_wave());
}

Timebase ToneSource::timebase() const {
    Timebase tb;
    tb.num = 1;
    tb.den = static_cast<uint32_t>(generator_.get_sample_rate());
    return tb;
}

SourceStatus ToneSource::next_frame(Frame& out) {
    std::vector<int16_t> samples = generator_.generate_samples(next_sample_, samples_per_frame_);

    out.kind = MediaKind::Audio;
    out.pts = next_sample_;
    out.timebase = timebase();
    out.duration = samples_per_frame_;
    out.flags = next_sample_ == 0 ? FRAME_FLAG_DISCONT : FRAME_FLAG_NONE;
    out.sample_rate = generator_.get_sample_rate();
    out.channels = generator_.get_channels();
    out.samples = samples_per_frame_;
    out.data.resize(samples.size() * sizeof(int16_t));
    std::memcpy(out.data.data(), samples.data(), out.data.size());

    next_sample_ += samples_per_frame_;
    return SourceStatus::Ok;
}
