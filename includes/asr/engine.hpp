#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace whispercore {

// Parameters used when a model is loaded.
struct EngineParams {
    bool use_gpu{false};
    int gpu_device{0};
    bool flash_attention{true};
};

// Per-call decoding parameters.
struct DecodeParams {
    int threads{0};                // <= 0: engine default
    std::string language{"auto"};
    bool translate{false};
};

// A segment as the engine reports it. t0/t1 are in 10 ms ticks.
struct DecodedSegment {
    std::int64_t t0{0};
    std::int64_t t1{0};
    std::string text;
    float confidence{0.0f};
};

struct DecodeOutput {
    std::vector<DecodedSegment> segments;
    std::optional<std::string> language;
};

// Loaded model plus its mutable decoding state. Not safe for concurrent
// decode() calls.
class EngineContext {
public:
    virtual ~EngineContext() = default;

    // Runs recognition over the whole buffer. Returns false on engine failure,
    // in which case out is left empty.
    virtual bool decode(const float* samples, std::size_t n_samples,
                        const DecodeParams& params, DecodeOutput& out) = 0;

    virtual std::string describe() const = 0;
    virtual std::string model_name() const = 0;
    virtual bool uses_gpu() const = 0;
};

class EngineLoader {
public:
    virtual ~EngineLoader() = default;

    virtual bool gpu_available(int device) const = 0;

    // Returns nullptr when the model cannot be loaded.
    virtual std::unique_ptr<EngineContext> load(const std::string& model_path,
                                                const EngineParams& params) = 0;
};

// whisper.cpp backed loader.
std::shared_ptr<EngineLoader> make_whisper_loader();

} // namespace whispercore
