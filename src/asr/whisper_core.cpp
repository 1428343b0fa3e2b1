#include "asr/whisper_core.hpp"
#include "audio/audio_file.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <filesystem>

namespace whispercore {

namespace {

// whisper.cpp reports segment boundaries in 10 ms units.
constexpr double kSecondsPerTick = 0.01;

std::string trim_ws(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
    return s.substr(a, b - a);
}

std::unique_ptr<EngineContext> load_engine(EngineLoader& loader, const std::string& path,
                                           const Configuration& config, std::string& failure) {
    EngineParams params;
    params.gpu_device = config.gpu_device;
    params.flash_attention = config.flash_attention;

    switch (config.gpu_mode) {
        case GpuMode::Disabled:
            params.use_gpu = false;
            break;

        case GpuMode::Required:
            if (!loader.gpu_available(config.gpu_device)) {
                failure = "GPU required but no GPU device " + std::to_string(config.gpu_device) +
                          " is available";
                return nullptr;
            }
            params.use_gpu = true;
            break;

        case GpuMode::Preferred:
            params.use_gpu = loader.gpu_available(config.gpu_device);
            if (!params.use_gpu) {
                log::info("No GPU device ", config.gpu_device, " available, using CPU");
            }
            break;
    }

    auto engine = loader.load(path, params);
    if (!engine && params.use_gpu && config.gpu_mode == GpuMode::Preferred) {
        log::warn("GPU load failed for ", path, ", retrying on CPU");
        params.use_gpu = false;
        engine = loader.load(path, params);
    }

    if (!engine) {
        failure = "Engine failed to load model " + path;
        return nullptr;
    }
    if (config.gpu_mode == GpuMode::Required && !engine->uses_gpu()) {
        failure = "GPU required but the engine initialized on CPU";
        return nullptr;
    }
    return engine;
}

} // namespace

Result<WhisperCore::Ptr> WhisperCore::create(const std::string& model_path) {
    return create(model_path, Configuration::default_configuration());
}

Result<WhisperCore::Ptr> WhisperCore::create(const std::string& model_path,
                                             const Configuration& config) {
    return create(model_path, config, make_whisper_loader());
}

Result<WhisperCore::Ptr> WhisperCore::create(const std::string& model_path,
                                             const Configuration& config,
                                             std::shared_ptr<EngineLoader> loader) {
    std::error_code ec;
    if (model_path.empty()) {
        return make_error(ErrorCode::InvalidModelPath, "Model path is empty");
    }
    if (!std::filesystem::exists(model_path, ec)) {
        return make_error(ErrorCode::InvalidModelPath, "Model file does not exist: " + model_path);
    }
    if (!std::filesystem::is_regular_file(model_path, ec)) {
        return make_error(ErrorCode::InvalidModelPath, "Model path is not a file: " + model_path);
    }
    if (!loader) {
        return make_error(ErrorCode::ModelLoadFailed, "No engine loader");
    }

    std::string failure;
    auto engine = load_engine(*loader, model_path, config, failure);
    if (!engine) {
        log::error(failure);
        return make_error(ErrorCode::ModelLoadFailed, failure);
    }

    log::info("Model ready: ", engine->describe());
    return Ptr(new WhisperCore(model_path, config, std::move(engine)));
}

WhisperCore::WhisperCore(std::string model_path, Configuration config,
                         std::unique_ptr<EngineContext> engine)
    : model_path_(std::move(model_path)), config_(std::move(config)), engine_(std::move(engine)) {}

WhisperCore::~WhisperCore() = default;

bool WhisperCore::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_ != nullptr;
}

std::string WhisperCore::model_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!engine_) return "Not initialized";
    return engine_->describe();
}

bool WhisperCore::is_using_gpu() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_ && engine_->uses_gpu();
}

Result<TranscriptionResult> WhisperCore::transcribe(const std::vector<float>& samples) {
    return transcribe(samples.data(), samples.size());
}

Result<TranscriptionResult> WhisperCore::transcribe(const float* samples, std::size_t sample_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcribe_locked(samples, sample_count);
}

Result<TranscriptionResult> WhisperCore::transcribe_file(const std::string& path) {
    log::info("Transcribing file ", path);
    auto audio = load_audio_file(path, kEngineSampleRate);
    if (!audio) {
        return audio.error();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return transcribe_locked(audio.value().data(), audio.value().size());
}

Result<TranscriptionResult> WhisperCore::transcribe_locked(const float* samples,
                                                           std::size_t sample_count) {
    if (!engine_) {
        return make_error(ErrorCode::ContextNotInitialized, "Engine context is not initialized");
    }
    if (!samples || sample_count == 0) {
        return make_error(ErrorCode::InvalidAudioData, "Audio buffer is empty");
    }
    if (sample_count > static_cast<std::size_t>(INT_MAX)) {
        return make_error(ErrorCode::InvalidAudioData,
                          "Audio buffer too large: " + std::to_string(sample_count) + " samples");
    }
    for (std::size_t i = 0; i < sample_count; ++i) {
        if (!std::isfinite(samples[i])) {
            return make_error(ErrorCode::InvalidAudioData,
                              "Non-finite sample at index " + std::to_string(i));
        }
    }

    DecodeParams params;
    params.threads = config_.threads;
    params.language = config_.language;
    params.translate = config_.translate;

    DecodeOutput decoded;
    if (!engine_->decode(samples, sample_count, params, decoded)) {
        return make_error(ErrorCode::TranscriptionFailed, "Engine failed to decode audio");
    }

    TranscriptionResult result;
    result.segments.reserve(decoded.segments.size());

    std::string full_text;
    double prev_end = 0.0;
    for (const auto& ds : decoded.segments) {
        full_text += ds.text;

        // keep segments ordered and non-overlapping, end >= start
        Segment seg;
        seg.start_time = std::max(static_cast<double>(ds.t0) * kSecondsPerTick, prev_end);
        seg.end_time = std::max(static_cast<double>(ds.t1) * kSecondsPerTick, seg.start_time);
        seg.text = trim_ws(ds.text);
        seg.confidence = std::isfinite(ds.confidence) ? std::clamp(ds.confidence, 0.0f, 1.0f) : 0.0f;
        prev_end = seg.end_time;

        result.segments.push_back(std::move(seg));
    }

    result.text = trim_ws(full_text);
    result.language = decoded.language;
    result.model_used = engine_->model_name();
    result.used_gpu = engine_->uses_gpu();

    log::info("Transcribed ", sample_count, " samples: ", result.segments.size(), " segments",
              result.used_gpu ? " (GPU)" : " (CPU)");
    return result;
}

} // namespace whispercore
