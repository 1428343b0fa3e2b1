#include "app/cli.hpp"
#include "asr/whisper_core.hpp"
#include "audio/audio_file.hpp"
#include "audio/audio_input.hpp"
#include "storage/transcript_store.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace whispercore {

namespace {

template <typename T, typename Convert>
T numeric_arg(const std::string& option, const std::string& value, Convert convert) {
    const std::string message = "invalid value for " + option + ": " + value;
    std::size_t used = 0;
    T v{};
    try {
        v = convert(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(message);
    }
    if (used != value.size()) throw std::invalid_argument(message);
    return v;
}

int int_arg(const std::string& option, const std::string& value) {
    return numeric_arg<int>(option, value,
                            [](const std::string& s, std::size_t* n) { return std::stoi(s, n); });
}

double double_arg(const std::string& option, const std::string& value) {
    return numeric_arg<double>(option, value,
                               [](const std::string& s, std::size_t* n) { return std::stod(s, n); });
}

void print_text(const TranscriptionResult& r) {
    std::cout << r.text << "\n";
    if (r.segments.empty()) return;
    std::cout << "\n";
    for (const auto& seg : r.segments) {
        std::cout << "[" << format_time_range(seg) << "] " << seg.text << "\n";
    }
    std::cout << "\nlanguage: " << r.language.value_or("unknown")
              << ", model: " << r.model_used
              << ", " << (r.used_gpu ? "GPU" : "CPU") << "\n";
}

void print_history(const std::vector<StoredTranscript>& rows, bool json) {
    if (json) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json j;
            j["id"] = row.id;
            j["created_ms"] = row.created_ms;
            j["source"] = row.source;
            j["status"] = to_string(row.status);
            if (row.status == TranscriptStatus::Completed) {
                j["result"] = row.result;
            } else {
                j["error_code"] = row.error_code.value_or(0);
                j["error_message"] = row.error_message;
            }
            out.push_back(std::move(j));
        }
        std::cout << out.dump(2) << "\n";
        return;
    }
    for (const auto& row : rows) {
        std::cout << "#" << row.id << " [" << to_string(row.status) << "] " << row.source << "\n";
        if (row.status == TranscriptStatus::Completed) {
            std::cout << "    " << row.result.text << "\n";
        } else {
            std::cout << "    error " << row.error_code.value_or(0) << ": " << row.error_message << "\n";
        }
    }
}

int fail(const Error& e) {
    std::cerr << "error " << e.describe() << "\n";
    return kExitFailure;
}

int fail(const std::string& message) {
    std::cerr << "Error: " << message << "\n";
    return kExitFailure;
}

} // namespace

void print_usage(std::ostream& out) {
    out << "whispercore-cli - transcribe audio with whisper.cpp\n"
        << "usage: whispercore-cli [options] <audio-file>\n"
        << "       whispercore-cli --record <seconds> [options]\n\n"
        << "  -m, --model <path>             ggml model file\n"
        << "      --gpu <mode>               disabled | preferred | required (default preferred)\n"
        << "      --gpu-device <index>       GPU device index (default 0)\n"
        << "      --no-flash-attn            Disable flash attention\n"
        << "  -t, --threads <n>              CPU threads (default: engine decides)\n"
        << "  -l, --language <code>          Spoken language, 'auto' to detect (default auto)\n"
        << "      --translate                Translate to English\n"
        << "      --json                     Print the result as JSON\n"
        << "      --db <path>                Transcript history DB (default XDG)\n"
        << "      --no-db                    Do not record this run\n"
        << "      --history <n>              Show the last n transcripts and exit\n"
        << "      --record <seconds>         Capture from the microphone instead of a file\n"
        << "      --input-device <index>     Microphone device index\n"
        << "      --save-recording <path>    Keep the captured audio as WAV\n"
        << "      --list-devices             List input devices and exit\n"
        << "      --config <path>            Config file (default XDG)\n"
        << "  -v, --verbose                  Debug logging\n"
        << "  -q, --quiet                    Errors only\n"
        << "  -h, --help                     Show this help\n";
}

CliArgs parse_cli_args(const std::vector<std::string>& args) {
    CliArgs a;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& s = args[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= args.size()) throw std::invalid_argument("missing value for " + s);
            return args[++i];
        };

        if      (s == "--model" || s == "-m") a.model_path = next();
        else if (s == "--gpu") {
            const std::string v = next();
            a.engine.gpu_mode = parse_gpu_mode(v);
            if (!a.engine.gpu_mode) throw std::invalid_argument("unknown GPU mode: " + v);
        }
        else if (s == "--gpu-device") a.engine.gpu_device = int_arg(s, next());
        else if (s == "--no-flash-attn") a.engine.flash_attention = false;
        else if (s == "--threads" || s == "-t") a.engine.threads = int_arg(s, next());
        else if (s == "--language" || s == "-l") a.engine.language = next();
        else if (s == "--translate") a.engine.translate = true;

        else if (s == "--record") a.record_seconds = double_arg(s, next());
        else if (s == "--input-device") a.input_device = int_arg(s, next());
        else if (s == "--save-recording") a.save_recording = next();
        else if (s == "--list-devices") a.list_devices = true;

        else if (s == "--json") a.json = true;
        else if (s == "--db") a.db_path = next();
        else if (s == "--no-db") a.no_db = true;
        else if (s == "--history") a.history = int_arg(s, next());
        else if (s == "--config") a.config_path = next();
        else if (s == "--verbose" || s == "-v") a.log_level = LogLevel::Debug;
        else if (s == "--quiet" || s == "-q") a.log_level = LogLevel::Error;
        else if (s == "--help" || s == "-h") a.help = true;

        else if (!s.empty() && s[0] == '-') throw std::invalid_argument("unknown option: " + s);
        else a.audio_path = s;
    }
    return a;
}

int run_cli(const std::vector<std::string>& argv, const std::atomic<bool>& stop) {
    CliArgs args;
    try {
        args = parse_cli_args(argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return kExitFailure;
    }
    if (args.help) {
        print_usage(std::cout);
        return kExitSuccess;
    }

    try {
        if (args.list_devices) {
            for (const auto& d : AudioInput::list_input_devices()) std::cout << d << "\n";
            return kExitSuccess;
        }

        const AppConfig file_cfg = load_config_file(args.config_path.value_or(default_config_path()));
        set_log_level(args.log_level.value_or(file_cfg.log_level.value_or(LogLevel::Warn)));

        std::unique_ptr<TranscriptStore> store;
        if (!args.no_db) {
            store = std::make_unique<TranscriptStore>(
                expand_path(args.db_path.value_or(file_cfg.db_path.value_or(default_db_path()))));
        }

        if (args.history) {
            if (!store) return fail("--history needs the transcript DB");
            print_history(store->recent(*args.history), args.json);
            return kExitSuccess;
        }

        if (!args.audio_path && !args.record_seconds) {
            print_usage(std::cerr);
            return kExitFailure;
        }

        const Configuration config = resolve_configuration(file_cfg, args.engine);
        const std::string model = expand_path(args.model_path.value_or(file_cfg.model_path.value_or("")));

        auto core = WhisperCore::create(model, config);
        if (!core) return fail(core.error());
        log::info("Model info: ", core.value()->model_info());

        std::string source;
        std::optional<Result<TranscriptionResult>> result;

        if (args.record_seconds) {
            AudioParams params;
            params.sample_rate = kEngineSampleRate;
            params.device_index = args.input_device ? args.input_device : file_cfg.input_device;
            if (params.device_index) {
                std::cerr << "Using input device: " << AudioInput::device_summary(*params.device_index) << "\n";
            }

            const auto duration = std::chrono::milliseconds(
                static_cast<long long>(*args.record_seconds * 1000.0));
            std::cerr << "Recording for " << *args.record_seconds << " s... (Ctrl+C to stop early)\n";
            std::vector<float> samples = record(params, duration, stop);

            source = "microphone";
            if (args.save_recording) {
                if (write_wav_file(*args.save_recording, samples, kEngineSampleRate)) {
                    source = *args.save_recording;
                } else {
                    log::warn("Could not save recording to ", *args.save_recording);
                }
            }
            result.emplace(core.value()->transcribe(samples));
        } else {
            source = *args.audio_path;
            result.emplace(core.value()->transcribe_file(source));
        }

        if (!*result) {
            if (store) store->record_failure(source, result->error());
            return fail(result->error());
        }

        const TranscriptionResult& r = result->value();
        if (store) {
            const auto id = store->record_success(source, r);
            log::debug("Saved transcript #", id, " to ", store->path());
        }

        if (args.json) {
            std::cout << nlohmann::json(r).dump(2) << "\n";
        } else {
            print_text(r);
        }
        return kExitSuccess;
    } catch (const std::exception& e) {
        return fail(e.what());
    }
}

} // namespace whispercore
