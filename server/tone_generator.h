/*
 * Tone Generator for Audio Test Sources
 *
 * Generates test signals as 16-bit PCM. Each sample is computed from its
 * absolute sample index, so frames can be regenerated at any offset and
 * long runs never accumulate phase error.
 */

#ifndef TONE_GENERATOR_H
#define TONE_GENERATOR_H

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

enum class ToneWave {
    Sine,
    Square,
    Saw,
    Triangle,
    Silence,
    WhiteNoise,
    Ticks       // Short sine burst at the start of every second
};

const char* tone_wave_name(ToneWave wave);
bool parse_tone_wave(const std::string& name, ToneWave& out);

class ToneGenerator {
public:
    ToneGenerator(int sample_rate = 8000, int channels = 1)
        : sample_rate_(sample_rate)
        , channels_(channels)
        , wave_(ToneWave::Sine)
        , frequency_(440.0)
        , volume_(0.8)
    {}

    void set_wave(ToneWave wave) { wave_ = wave; }
    ToneWave get_wave() const { return wave_; }

    // Set tone frequency in Hz
    void set_frequency(double freq) { frequency_ = freq; }
    double get_frequency() const { return frequency_; }

    // 0.0 - 1.0 of full scale
    void set_volume(double volume) { volume_ = volume; }
    double get_volume() const { return volume_; }

    int get_sample_rate() const { return sample_rate_; }
    int get_channels() const { return channels_; }

    // Value of sample `n` (mono), full scale scaled by volume
    int16_t sample_at(int64_t n) const;

    // Generate `num_samples` per channel starting at sample index `first`.
    // Returns interleaved samples (L,R,L,R,... for stereo).
    std::vector<int16_t> generate_samples(int64_t first, int num_samples) const {
        std::vector<int16_t> samples;
        samples.reserve(static_cast<size_t>(num_samples) * channels_);

        for (int i = 0; i < num_samples; i++) {
            int16_t sample = sample_at(first + i);
            // Duplicate for all channels
            for (int ch = 0; ch < channels_; ch++) {
                samples.push_back(sample);
            }
        }
        return samples;
    }

private:
    int sample_rate_;
    int channels_;
    ToneWave wave_;
    double frequency_;
    double volume_;
};

#endif // TONE_GENERATOR_H
