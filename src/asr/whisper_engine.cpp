#include "asr/whisper_engine.hpp"
#include "core/log.hpp"

#include <climits>
#include <mutex>
#include <sstream>
#include "ggml-backend.h"

namespace whispercore {

namespace {

LogLevel to_log_level(ggml_log_level level) {
    switch (level) {
        case GGML_LOG_LEVEL_ERROR: return LogLevel::Error;
        case GGML_LOG_LEVEL_WARN:  return LogLevel::Warn;
        default:                   return LogLevel::Debug;   // whisper's INFO is per-load chatter
    }
}

// Lines logged on this thread while a whisper_init_* call runs.
thread_local std::vector<std::string>* t_load_log = nullptr;

class LoadLogCapture {
public:
    explicit LoadLogCapture(std::vector<std::string>& sink) { t_load_log = &sink; }
    ~LoadLogCapture() { t_load_log = nullptr; }
    LoadLogCapture(const LoadLogCapture&) = delete;
    LoadLogCapture& operator=(const LoadLogCapture&) = delete;
};

std::mutex g_log_mutex;
EngineLogAssembler g_assembler;

void emit(const EngineLogLine& line) {
    log::write(line.level, "whisper: ", line.text);
    if (t_load_log) t_load_log->push_back(line.text);
}

void whisper_log_forward(ggml_log_level level, const char* text, void* /*user_data*/) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    for (const auto& line : g_assembler.feed(level, text)) emit(line);
}

void flush_engine_log() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (auto line = g_assembler.flush()) emit(*line);
}

void init_backends() {
    static std::once_flag once;
    std::call_once(once, [] {
        whisper_log_set(whisper_log_forward, nullptr);
        ggml_backend_load_all();
    });
}

} // namespace

std::vector<EngineLogLine> EngineLogAssembler::feed(ggml_log_level level, const char* text) {
    std::vector<EngineLogLine> done;
    if (level != GGML_LOG_LEVEL_CONT) {
        if (auto line = flush()) done.push_back(std::move(*line));
        level_ = to_log_level(level);
    }
    if (text) pending_ += text;

    std::size_t nl;
    while ((nl = pending_.find('\n')) != std::string::npos) {
        std::string text_line = pending_.substr(0, nl);
        pending_.erase(0, nl + 1);
        if (!text_line.empty() && text_line.back() == '\r') text_line.pop_back();
        if (!text_line.empty()) done.push_back({level_, std::move(text_line)});
    }
    return done;
}

std::optional<EngineLogLine> EngineLogAssembler::flush() {
    if (pending_.empty()) return std::nullopt;
    EngineLogLine line{level_, std::move(pending_)};
    pending_.clear();
    return line;
}

bool gpu_init_failed(const std::vector<std::string>& load_log) {
    for (const auto& line : load_log) {
        if (line.find("no GPU found") != std::string::npos) return true;
        if (line.find("failed to initialize") != std::string::npos &&
            line.find("backend") != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ------------------------------------------------------------

WhisperEngine::WhisperEngine(whisper_context* ctx, bool use_gpu, int gpu_device)
    : ctx_(ctx, whisper_free), use_gpu_(use_gpu), gpu_device_(gpu_device) {}

bool WhisperEngine::decode(const float* samples, std::size_t n_samples,
                           const DecodeParams& params, DecodeOutput& out) {
    out = DecodeOutput{};
    if (!ctx_ || !samples || n_samples == 0 || n_samples > static_cast<std::size_t>(INT_MAX)) {
        return false;
    }

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_realtime   = false;
    wparams.print_progress   = false;
    wparams.print_timestamps = false;
    wparams.print_special    = false;
    wparams.translate        = params.translate;
    wparams.language         = params.language.empty() ? "auto" : params.language.c_str();
    wparams.n_max_text_ctx   = 16384;
    wparams.offset_ms        = 0;
    wparams.duration_ms      = 0;
    if (params.threads > 0) {
        wparams.n_threads = params.threads;
    }

    log::debug("whisper_full: ", n_samples, " samples, ", wparams.n_threads, " threads, language ",
               wparams.language);

    if (whisper_full(ctx_.get(), wparams, samples, static_cast<int>(n_samples)) != 0) {
        log::error("whisper_full failed");
        return false;
    }

    const int n_segments = whisper_full_n_segments(ctx_.get());
    out.segments.reserve(static_cast<std::size_t>(n_segments));

    for (int i = 0; i < n_segments; ++i) {
        DecodedSegment seg;
        const char* text = whisper_full_get_segment_text(ctx_.get(), i);
        seg.text = text ? text : "";
        seg.t0 = whisper_full_get_segment_t0(ctx_.get(), i);
        seg.t1 = whisper_full_get_segment_t1(ctx_.get(), i);
        seg.confidence = segment_confidence(i);
        out.segments.push_back(std::move(seg));
    }

    if (n_segments > 0) {
        const char* lang = whisper_lang_str(whisper_full_lang_id(ctx_.get()));
        if (lang) out.language = std::string(lang);
    }

    return true;
}

float WhisperEngine::segment_confidence(int segment) const {
    const whisper_token eot = whisper_token_eot(ctx_.get());
    const int n_tokens = whisper_full_n_tokens(ctx_.get(), segment);

    float sum = 0.0f;
    int counted = 0;
    for (int j = 0; j < n_tokens; ++j) {
        // special tokens (timestamps, sot, eot...) sit at or above eot
        if (whisper_full_get_token_id(ctx_.get(), segment, j) >= eot) continue;
        sum += whisper_full_get_token_p(ctx_.get(), segment, j);
        ++counted;
    }

    if (counted == 0) {
        const float no_speech = whisper_full_get_segment_no_speech_prob(ctx_.get(), segment);
        return no_speech >= 1.0f ? 0.0f : 1.0f - no_speech;
    }
    return sum / static_cast<float>(counted);
}

std::string WhisperEngine::describe() const {
    std::ostringstream oss;
    oss << "Type: " << whisper_model_type_readable(ctx_.get())
        << ", Vocab: " << whisper_n_vocab(ctx_.get())
        << ", Audio ctx: " << whisper_n_audio_ctx(ctx_.get())
        << ", Text ctx: " << whisper_n_text_ctx(ctx_.get())
        << ", Backend: ";
    if (use_gpu_) {
        oss << "GPU (device " << gpu_device_ << ")";
    } else {
        oss << "CPU";
    }
    return oss.str();
}

std::string WhisperEngine::model_name() const {
    return std::string("whisper.cpp:") + whisper_model_type_readable(ctx_.get());
}

// ------------------------------------------------------------

WhisperLoader::WhisperLoader() {
    init_backends();
}

int WhisperLoader::gpu_device_count() {
    int count = 0;
    const std::size_t n = ggml_backend_dev_count();
    for (std::size_t i = 0; i < n; ++i) {
        ggml_backend_dev_t dev = ggml_backend_dev_get(i);
        if (dev && ggml_backend_dev_type(dev) == GGML_BACKEND_DEVICE_TYPE_GPU) {
            ++count;
        }
    }
    return count;
}

bool WhisperLoader::gpu_available(int device) const {
    return device >= 0 && device < gpu_device_count();
}

std::unique_ptr<EngineContext> WhisperLoader::load(const std::string& model_path,
                                                   const EngineParams& params) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu    = params.use_gpu;
    cparams.gpu_device = params.gpu_device;
    cparams.flash_attn = params.flash_attention;

    log::info("Loading model ", model_path, " (", params.use_gpu ? "GPU" : "CPU", ")");

    std::vector<std::string> load_log;
    whisper_context* ctx = nullptr;
    {
        LoadLogCapture capture(load_log);
        ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
        flush_engine_log();
    }
    if (!ctx) {
        log::error("whisper_init_from_file_with_params failed for ", model_path);
        return nullptr;
    }

    // whisper.cpp drops to CPU on its own when the GPU backend cannot start
    bool on_gpu = params.use_gpu;
    if (on_gpu && (gpu_init_failed(load_log) || !gpu_available(params.gpu_device))) {
        log::warn("GPU backend did not initialize for ", model_path, ", context is on CPU");
        on_gpu = false;
    }
    return std::make_unique<WhisperEngine>(ctx, on_gpu, params.gpu_device);
}

std::shared_ptr<EngineLoader> make_whisper_loader() {
    return std::make_shared<WhisperLoader>();
}

} // namespace whispercore
