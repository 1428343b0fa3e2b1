#include "audio/audio_file.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sndfile.h>

namespace whispercore {

namespace {

struct SndFileCloser {
    void operator()(SNDFILE* f) const {
        if (f) sf_close(f);
    }
};
using SndFilePtr = std::unique_ptr<SNDFILE, SndFileCloser>;

} // namespace

std::vector<float> downmix_to_mono(const std::vector<float>& interleaved, int channels) {
    if (channels <= 1) return interleaved;

    const std::size_t frames = interleaved.size() / static_cast<std::size_t>(channels);
    std::vector<float> mono(frames);
    for (std::size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) {
            sum += interleaved[i * static_cast<std::size_t>(channels) + static_cast<std::size_t>(ch)];
        }
        mono[i] = sum / static_cast<float>(channels);
    }
    return mono;
}

std::vector<float> resample_linear(const std::vector<float>& in, int sr_in, int sr_out) {
    if (sr_in <= 0 || sr_out <= 0 || in.empty() || sr_in == sr_out) return in;

    const double ratio = static_cast<double>(sr_out) / static_cast<double>(sr_in);
    const std::size_t n_out = static_cast<std::size_t>(
        std::max<std::int64_t>(1, std::llround(static_cast<double>(in.size()) * ratio)));

    std::vector<float> out(n_out);
    for (std::size_t i = 0; i < n_out; ++i) {
        const double pos = static_cast<double>(i) / ratio;
        const std::size_t i0 = std::min(static_cast<std::size_t>(std::floor(pos)), in.size() - 1);
        const std::size_t i1 = std::min(i0 + 1, in.size() - 1);
        const double t = pos - static_cast<double>(i0);
        out[i] = static_cast<float>((1.0 - t) * in[i0] + t * in[i1]);
    }
    return out;
}

Result<std::vector<float>> load_audio_file(const std::string& path, int target_rate) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
        return make_error(ErrorCode::InvalidAudioData, "Audio file not found: " + path);
    }

    SF_INFO info;
    std::memset(&info, 0, sizeof(info));
    SndFilePtr file(sf_open(path.c_str(), SFM_READ, &info));
    if (!file) {
        return make_error(ErrorCode::InvalidAudioData,
                          "Failed to open audio file " + path + ": " + sf_strerror(nullptr));
    }

    if (info.frames <= 0 || info.channels <= 0 || info.samplerate <= 0) {
        return make_error(ErrorCode::InvalidAudioData, "Audio file has no frames: " + path);
    }

    std::vector<float> interleaved(static_cast<std::size_t>(info.frames) *
                                   static_cast<std::size_t>(info.channels));
    const sf_count_t frames_read = sf_readf_float(file.get(), interleaved.data(), info.frames);
    if (frames_read <= 0) {
        return make_error(ErrorCode::InvalidAudioData,
                          "Failed to read audio data from " + path + ": " + sf_strerror(file.get()));
    }
    interleaved.resize(static_cast<std::size_t>(frames_read) * static_cast<std::size_t>(info.channels));

    std::vector<float> mono = downmix_to_mono(interleaved, info.channels);
    if (info.samplerate != target_rate) {
        log::debug("Resampling ", path, " from ", info.samplerate, " Hz to ", target_rate, " Hz");
        mono = resample_linear(mono, info.samplerate, target_rate);
    }

    log::debug("Decoded ", path, ": ", frames_read, " frames, ", info.channels, " ch, ",
               mono.size(), " samples @ ", target_rate, " Hz");
    return mono;
}

bool write_wav_file(const std::string& path, const std::vector<float>& samples, int sample_rate) {
    std::error_code ec;
    const std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    SF_INFO info;
    std::memset(&info, 0, sizeof(info));
    info.samplerate = sample_rate;
    info.channels = 1;
    info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    SndFilePtr file(sf_open(path.c_str(), SFM_WRITE, &info));
    if (!file) {
        log::error("Cannot write ", path, ": ", sf_strerror(nullptr));
        return false;
    }

    const sf_count_t n = static_cast<sf_count_t>(samples.size());
    if (sf_writef_float(file.get(), samples.data(), n) != n) {
        log::error("Short write to ", path, ": ", sf_strerror(file.get()));
        return false;
    }
    return true;
}

} // namespace whispercore
