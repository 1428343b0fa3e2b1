#pragma once

#include <optional>
#include <string>

namespace whispercore {

enum class GpuMode {
    Disabled  = 0,  // CPU only
    Preferred = 1,  // try GPU first, fall back to CPU
    Required  = 2   // GPU only, fail if not available
};

const char* to_string(GpuMode mode);
std::optional<GpuMode> parse_gpu_mode(const std::string& s);

// Engine and decoding settings. Copied into a WhisperCore at creation time
// and read-only from then on.
struct Configuration {
    GpuMode gpu_mode = GpuMode::Preferred;
    int gpu_device = 0;            // GPU device index (0 for first GPU)
    bool flash_attention = true;
    int threads = 0;               // <= 0 lets the engine pick

    std::string language = "auto"; // "auto" = detect
    bool translate = false;        // translate to English

    Configuration() = default;
    explicit Configuration(GpuMode mode) : gpu_mode(mode) {}

    static Configuration default_configuration() { return Configuration(); }
};

} // namespace whispercore
