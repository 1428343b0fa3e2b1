#pragma once

#include "asr/engine.hpp"
#include "core/configuration.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace whispercore {

// Speech recognition facade over a single engine context.
//
// Instances only exist once a model has loaded successfully; create() is the
// sole way to obtain one. The engine context is owned exclusively and freed
// when the instance is destroyed.
//
// Threading: one transcription runs at a time per instance. Concurrent calls
// block on an internal lock and run one after another. Calls are synchronous
// and cannot be cancelled once started. Use one instance per concurrent
// stream if parallel decoding is needed.
class WhisperCore {
public:
    using Ptr = std::unique_ptr<WhisperCore>;

    // Default configuration (GPU preferred with CPU fallback).
    static Result<Ptr> create(const std::string& model_path);

    static Result<Ptr> create(const std::string& model_path, const Configuration& config);

    // Same as above with an explicit engine loader.
    static Result<Ptr> create(const std::string& model_path, const Configuration& config,
                              std::shared_ptr<EngineLoader> loader);

    ~WhisperCore();

    WhisperCore(const WhisperCore&) = delete;
    WhisperCore& operator=(const WhisperCore&) = delete;

    // samples: 16 kHz mono float32 PCM.
    Result<TranscriptionResult> transcribe(const float* samples, std::size_t sample_count);
    Result<TranscriptionResult> transcribe(const std::vector<float>& samples);

    // Decodes and resamples the file to 16 kHz mono first.
    Result<TranscriptionResult> transcribe_file(const std::string& path);

    bool is_initialized() const;
    std::string model_info() const;
    bool is_using_gpu() const;
    const Configuration& configuration() const { return config_; }
    const std::string& model_path() const { return model_path_; }

private:
    WhisperCore(std::string model_path, Configuration config,
                std::unique_ptr<EngineContext> engine);

    Result<TranscriptionResult> transcribe_locked(const float* samples, std::size_t sample_count);

    const std::string model_path_;
    const Configuration config_;
    std::unique_ptr<EngineContext> engine_;
    mutable std::mutex mutex_;
};

} // namespace whispercore
