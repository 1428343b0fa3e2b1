#pragma once

#include "asr/engine.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

namespace whispercore::testing {

// Scripted engine: returns the configured segments, or fails on demand.
struct FakeScript {
    std::vector<DecodedSegment> segments;
    std::optional<std::string> language{"en"};
    bool fail_decode = false;
    std::chrono::milliseconds decode_delay{0};

    std::atomic<int> decode_calls{0};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::atomic<int> destroyed{0};
    std::size_t last_sample_count = 0;
    DecodeParams last_params;
};

class FakeEngine : public EngineContext {
public:
    FakeEngine(std::shared_ptr<FakeScript> script, bool use_gpu)
        : script_(std::move(script)), use_gpu_(use_gpu) {}
    ~FakeEngine() override { script_->destroyed++; }

    bool decode(const float* /*samples*/, std::size_t n_samples,
                const DecodeParams& params, DecodeOutput& out) override {
        const int now = ++script_->in_flight;
        int prev = script_->max_in_flight.load();
        while (now > prev && !script_->max_in_flight.compare_exchange_weak(prev, now)) {}

        script_->decode_calls++;
        script_->last_sample_count = n_samples;
        script_->last_params = params;
        if (script_->decode_delay.count() > 0) {
            std::this_thread::sleep_for(script_->decode_delay);
        }
        script_->in_flight--;

        out = DecodeOutput{};
        if (script_->fail_decode) return false;
        out.segments = script_->segments;
        out.language = script_->language;
        return true;
    }

    std::string describe() const override {
        return std::string("Type: fake, Backend: ") + (use_gpu_ ? "GPU" : "CPU");
    }
    std::string model_name() const override { return "fake-model"; }
    bool uses_gpu() const override { return use_gpu_; }

private:
    std::shared_ptr<FakeScript> script_;
    bool use_gpu_;
};

class FakeLoader : public EngineLoader {
public:
    explicit FakeLoader(std::shared_ptr<FakeScript> script) : script_(std::move(script)) {}

    bool has_gpu = false;
    bool fail_gpu_load = false;
    bool fail_load = false;
    bool gpu_init_falls_back = false;   // context comes up on CPU despite use_gpu
    std::vector<EngineParams> loads;

    bool gpu_available(int device) const override { return has_gpu && device == 0; }

    std::unique_ptr<EngineContext> load(const std::string& /*model_path*/,
                                        const EngineParams& params) override {
        loads.push_back(params);
        if (fail_load) return nullptr;
        if (params.use_gpu && fail_gpu_load) return nullptr;
        return std::make_unique<FakeEngine>(script_, params.use_gpu && !gpu_init_falls_back);
    }

private:
    std::shared_ptr<FakeScript> script_;
};

// A file that exists, so model path validation passes.
class TempModelFile {
public:
    TempModelFile() {
        path_ = std::filesystem::temp_directory_path() /
                ("whispercore-test-model-" + std::to_string(::getpid()) + "-" +
                 std::to_string(next_id()) + ".bin");
        std::ofstream(path_) << "ggml";
    }
    ~TempModelFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    std::string path() const { return path_.string(); }

private:
    static int next_id() {
        static std::atomic<int> counter{0};
        return ++counter;
    }

    std::filesystem::path path_;
};

} // namespace whispercore::testing
