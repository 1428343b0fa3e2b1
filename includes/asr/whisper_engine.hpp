#pragma once

#include "asr/engine.hpp"
#include "core/log.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "whisper.h"

namespace whispercore {

struct EngineLogLine {
    LogLevel level{LogLevel::Debug};
    std::string text;
};

// Reassembles whisper/ggml log output into whole lines. GGML_LOG_LEVEL_CONT
// fragments continue the pending line at that line's level.
class EngineLogAssembler {
public:
    // Returns the lines completed by this fragment.
    std::vector<EngineLogLine> feed(ggml_log_level level, const char* text);

    // Pending text without a trailing newline, if any.
    std::optional<EngineLogLine> flush();

private:
    LogLevel level_{LogLevel::Debug};
    std::string pending_;
};

// True when the log of a whisper_init_* call shows that the GPU backend did
// not come up and the context was created on CPU instead.
bool gpu_init_failed(const std::vector<std::string>& load_log);

class WhisperEngine : public EngineContext {
public:
    WhisperEngine(whisper_context* ctx, bool use_gpu, int gpu_device);
    ~WhisperEngine() override = default;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    bool decode(const float* samples, std::size_t n_samples,
                const DecodeParams& params, DecodeOutput& out) override;

    std::string describe() const override;
    std::string model_name() const override;
    bool uses_gpu() const override { return use_gpu_; }

private:
    float segment_confidence(int segment) const;

    std::unique_ptr<whisper_context, void (*)(whisper_context*)> ctx_;
    bool use_gpu_{false};
    int gpu_device_{0};
};

// Loads every ggml backend library once, so GPU devices are visible before
// the first model load.
class WhisperLoader : public EngineLoader {
public:
    WhisperLoader();

    bool gpu_available(int device) const override;
    std::unique_ptr<EngineContext> load(const std::string& model_path,
                                        const EngineParams& params) override;

    // Number of ggml GPU devices registered in this process.
    static int gpu_device_count();
};

} // namespace whispercore
