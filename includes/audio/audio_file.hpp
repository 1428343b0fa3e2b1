#pragma once

#include "core/error.hpp"

#include <string>
#include <vector>

namespace whispercore {

// whisper.cpp input format: 16 kHz, mono, float32 in [-1, 1].
inline constexpr int kEngineSampleRate = 16000;

// Decodes any libsndfile-readable file, downmixes to mono and resamples to
// target_rate. Fails with InvalidAudioData when the file cannot be opened or
// holds no frames.
Result<std::vector<float>> load_audio_file(const std::string& path,
                                           int target_rate = kEngineSampleRate);

std::vector<float> downmix_to_mono(const std::vector<float>& interleaved, int channels);

// Linear interpolation. Output length is round(n * sr_out / sr_in), at least 1.
std::vector<float> resample_linear(const std::vector<float>& in, int sr_in, int sr_out);

// 16-bit PCM WAV. Returns false if the file cannot be written.
bool write_wav_file(const std::string& path, const std::vector<float>& samples, int sample_rate);

} // namespace whispercore
