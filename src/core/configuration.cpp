#include "core/configuration.hpp"

#include <algorithm>
#include <cctype>

namespace whispercore {

const char* to_string(GpuMode mode) {
    switch (mode) {
        case GpuMode::Disabled:  return "disabled";
        case GpuMode::Preferred: return "preferred";
        case GpuMode::Required:  return "required";
    }
    return "unknown";
}

std::optional<GpuMode> parse_gpu_mode(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (v == "disabled" || v == "cpu" || v == "off") return GpuMode::Disabled;
    if (v == "preferred" || v == "auto") return GpuMode::Preferred;
    if (v == "required" || v == "gpu") return GpuMode::Required;
    return std::nullopt;
}

} // namespace whispercore
