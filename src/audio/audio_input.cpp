#include "audio/audio_input.hpp"
#include "core/log.hpp"

#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace whispercore {

namespace {

void check_pa(PaError err, const char* what) {
    if (err != paNoError) {
        throw std::runtime_error(std::string(what) + " failed: " + Pa_GetErrorText(err));
    }
}

std::string describe_device(int index, const PaDeviceInfo* info) {
    std::ostringstream oss;
    oss << "[" << index << "] ";
    if (!info) {
        oss << "<invalid device index>";
        return oss.str();
    }
    const PaHostApiInfo* api = Pa_GetHostApiInfo(info->hostApi);
    oss << info->name
        << " - API: " << (api ? api->name : "?")
        << ", inCh: " << info->maxInputChannels
        << ", defaultSR: " << info->defaultSampleRate;
    return oss.str();
}

} // namespace

PortAudioSession::PortAudioSession() {
    check_pa(Pa_Initialize(), "Pa_Initialize");
}

PortAudioSession::~PortAudioSession() {
    Pa_Terminate();
}

// ------------------------------------------------------------

AudioInput::~AudioInput() {
    close();
}

std::vector<std::string> AudioInput::list_input_devices() {
    PortAudioSession session;
    std::vector<std::string> out;
    const int count = Pa_GetDeviceCount();
    if (count < 0) {
        log::error("Pa_GetDeviceCount failed: ", Pa_GetErrorText(count));
        return out;
    }
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) out.push_back(describe_device(i, info));
    }
    return out;
}

std::string AudioInput::device_summary(int device_index) {
    PortAudioSession session;
    return describe_device(device_index, Pa_GetDeviceInfo(device_index));
}

void AudioInput::open(const AudioParams& params, Callback cb) {
    if (stream_) throw std::runtime_error("Capture stream already open");

    const int device = params.device_index.value_or(Pa_GetDefaultInputDevice());
    if (device == paNoDevice) throw std::runtime_error("No default input device available");

    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    if (!info || info->maxInputChannels <= 0) {
        throw std::runtime_error("Not an input device: " + std::to_string(device));
    }

    channels_ = params.channels == 0 ? 1 : params.channels;
    callback_ = std::move(cb);

    PaStreamParameters input{};
    input.device = device;
    input.channelCount = static_cast<int>(channels_);
    input.sampleFormat = paFloat32;
    input.suggestedLatency = info->defaultLowInputLatency;

    log::debug("Opening capture on ", describe_device(device, info), " at ", params.sample_rate, " Hz");
    const PaError err = Pa_OpenStream(&stream_, &input, nullptr, params.sample_rate,
                                      params.frames_per_buffer, paClipOff,
                                      &AudioInput::on_frames, this);
    if (err != paNoError) {
        stream_ = nullptr;
        check_pa(err, "Pa_OpenStream");
    }
}

void AudioInput::start() {
    if (!stream_) throw std::runtime_error("Capture stream not open");
    check_pa(Pa_StartStream(stream_), "Pa_StartStream");
    running_.store(true);
}

void AudioInput::stop() {
    if (!stream_ || !running_.exchange(false)) return;
    const PaError err = Pa_StopStream(stream_);
    if (err != paNoError) log::warn("Pa_StopStream failed: ", Pa_GetErrorText(err));
}

void AudioInput::close() {
    if (!stream_) return;
    if (running_.exchange(false)) Pa_AbortStream(stream_);
    const PaError err = Pa_CloseStream(stream_);
    if (err != paNoError) log::warn("Pa_CloseStream failed: ", Pa_GetErrorText(err));
    stream_ = nullptr;
}

int AudioInput::on_frames(const void* input, void* /*output*/, unsigned long frame_count,
                          const PaStreamCallbackTimeInfo* /*time_info*/,
                          PaStreamCallbackFlags /*status_flags*/, void* user_data) {
    auto* self = static_cast<AudioInput*>(user_data);
    if (self && self->callback_ && input) {
        self->callback_(static_cast<const float*>(input),
                        static_cast<std::size_t>(frame_count) * self->channels_);
    }
    return paContinue;
}

// ------------------------------------------------------------

std::vector<float> record(const AudioParams& params,
                          std::chrono::milliseconds duration,
                          const std::atomic<bool>& stop) {
    AudioParams mono = params;
    mono.channels = 1;

    std::mutex buf_mutex;
    std::vector<float> captured;
    captured.reserve(static_cast<std::size_t>(mono.sample_rate * duration.count() / 1000.0) +
                     mono.frames_per_buffer);

    AudioInput input;
    input.open(mono, [&](const float* data, std::size_t n) {
        std::lock_guard<std::mutex> lock(buf_mutex);
        captured.insert(captured.end(), data, data + n);
    });
    input.start();

    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    input.stop();
    input.close();

    log::info("Recorded ", captured.size(), " samples @ ", mono.sample_rate, " Hz");
    return captured;
}

} // namespace whispercore
