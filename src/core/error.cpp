#include "core/error.hpp"

namespace whispercore {

namespace {

class WhisperCoreErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return kErrorDomain; }

    std::string message(int ev) const override {
        switch (static_cast<ErrorCode>(ev)) {
            case ErrorCode::ModelLoadFailed:       return "model failed to load";
            case ErrorCode::TranscriptionFailed:   return "transcription failed";
            case ErrorCode::InvalidAudioData:      return "invalid audio data";
            case ErrorCode::InvalidModelPath:      return "invalid model path";
            case ErrorCode::ContextNotInitialized: return "engine context not initialized";
        }
        return "unknown whispercore error";
    }
};

} // namespace

const std::error_category& error_category() noexcept {
    static const WhisperCoreErrorCategory category;
    return category;
}

std::error_code make_error_code(ErrorCode code) noexcept {
    return {static_cast<int>(code), error_category()};
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ModelLoadFailed:       return "model_load_failed";
        case ErrorCode::TranscriptionFailed:   return "transcription_failed";
        case ErrorCode::InvalidAudioData:      return "invalid_audio_data";
        case ErrorCode::InvalidModelPath:      return "invalid_model_path";
        case ErrorCode::ContextNotInitialized: return "context_not_initialized";
    }
    return "unknown";
}

std::string Error::describe() const {
    std::string out = std::to_string(static_cast<int>(code));
    out += " (";
    out += to_string(code);
    out += ")";
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

} // namespace whispercore
