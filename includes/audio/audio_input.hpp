#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <portaudio.h>
#include <string>
#include <vector>

namespace whispercore {

struct AudioParams {
    double sample_rate = 16000.0;          // engine rate
    unsigned int channels = 1;             // mono
    unsigned long frames_per_buffer = 512; // ~32 ms @ 16k
    std::optional<int> device_index;       // if not set, use default input
};

// Pa_Initialize/Pa_Terminate pair. PortAudio reference-counts these, so
// sessions may nest.
class PortAudioSession {
public:
    PortAudioSession();
    ~PortAudioSession();
    PortAudioSession(const PortAudioSession&) = delete;
    PortAudioSession& operator=(const PortAudioSession&) = delete;
};

// PortAudio input stream delivering interleaved float32 samples to a callback.
// The callback runs on the PortAudio thread.
class AudioInput {
public:
    using Callback = std::function<void(const float* data, std::size_t samples)>;

    AudioInput() = default;
    ~AudioInput();
    AudioInput(const AudioInput&) = delete;
    AudioInput& operator=(const AudioInput&) = delete;

    // "[index] name - API: host, inCh: n, defaultSR: rate" per input device.
    static std::vector<std::string> list_input_devices();
    static std::string device_summary(int device_index);

    void open(const AudioParams& params, Callback cb);
    void start();
    void stop();
    void close();
    bool is_running() const { return running_.load(); }

private:
    static int on_frames(const void* input, void* output, unsigned long frame_count,
                         const PaStreamCallbackTimeInfo* time_info,
                         PaStreamCallbackFlags status_flags, void* user_data);

    PortAudioSession session_;
    PaStream* stream_ = nullptr;
    unsigned int channels_ = 1;
    Callback callback_;
    std::atomic<bool> running_{false};
};

// Captures mono audio for `duration` or until `stop` becomes true.
// Throws std::runtime_error on PortAudio failures.
std::vector<float> record(const AudioParams& params,
                          std::chrono::milliseconds duration,
                          const std::atomic<bool>& stop);

} // namespace whispercore
