#include "app/app_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string_view>
#include <unordered_map>

namespace whispercore {

namespace {

std::string_view strip(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<int> to_int(const std::string& s) {
    try {
        std::size_t used = 0;
        const int v = std::stoi(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> to_bool(const std::string& s) {
    const std::string v = lower(s);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return std::nullopt;
}

using Setter = std::function<void(AppConfig&, const std::string&)>;

// Keys are matched case-insensitively; aliases share a setter.
const std::unordered_map<std::string, Setter>& setters() {
    static const std::unordered_map<std::string, Setter> table = [] {
        std::unordered_map<std::string, Setter> t;
        const Setter model = [](AppConfig& c, const std::string& v) { c.model_path = expand_path(v); };
        const Setter gpu = [](AppConfig& c, const std::string& v) { c.gpu_mode = parse_gpu_mode(v); };
        const Setter flash = [](AppConfig& c, const std::string& v) { c.flash_attention = to_bool(v); };

        t["model"] = model;
        t["model_path"] = model;
        t["gpu_mode"] = gpu;
        t["gpu"] = gpu;
        t["gpu_device"] = [](AppConfig& c, const std::string& v) { c.gpu_device = to_int(v); };
        t["flash_attention"] = flash;
        t["flash_attn"] = flash;
        t["threads"] = [](AppConfig& c, const std::string& v) { c.threads = to_int(v); };
        t["language"] = [](AppConfig& c, const std::string& v) { c.language = v; };
        t["translate"] = [](AppConfig& c, const std::string& v) { c.translate = to_bool(v); };
        t["db_path"] = [](AppConfig& c, const std::string& v) { c.db_path = expand_path(v); };
        t["input_device"] = [](AppConfig& c, const std::string& v) { c.input_device = to_int(v); };
        t["log_level"] = [](AppConfig& c, const std::string& v) { c.log_level = parse_log_level(v); };
        return t;
    }();
    return table;
}

} // namespace

void AppConfig::apply_to(Configuration& config) const {
    if (gpu_mode) config.gpu_mode = *gpu_mode;
    if (gpu_device) config.gpu_device = *gpu_device;
    if (flash_attention) config.flash_attention = *flash_attention;
    if (threads) config.threads = *threads;
    if (language) config.language = *language;
    if (translate) config.translate = *translate;
}

void EngineOverrides::apply_to(Configuration& config) const {
    if (gpu_mode) config.gpu_mode = *gpu_mode;
    if (gpu_device) config.gpu_device = *gpu_device;
    if (flash_attention) config.flash_attention = *flash_attention;
    if (threads) config.threads = *threads;
    if (language) config.language = *language;
    if (translate) config.translate = *translate;
}

Configuration resolve_configuration(const AppConfig& file, const EngineOverrides& cli) {
    Configuration config = Configuration::default_configuration();
    file.apply_to(config);
    cli.apply_to(config);
    return config;
}

std::string expand_path(const std::string& p) {
    if (p.rfind("~/", 0) != 0) return p;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return p;
    return std::string(home) + p.substr(1);
}

std::string default_config_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/whispercore/whispercore.toml";
    }
    const char* home = std::getenv("HOME");
    return (home ? std::string(home) + "/.config" : std::string(".config")) +
           "/whispercore/whispercore.toml";
}

std::optional<std::pair<std::string, std::string>> parse_config_line(const std::string& line) {
    std::string_view body(line);
    body = body.substr(0, std::min(body.find('#'), body.find(';')));
    body = strip(body);
    if (body.empty()) return std::nullopt;

    auto sep = body.find('=');
    if (sep == std::string_view::npos) sep = body.find(':');
    if (sep == std::string_view::npos) return std::nullopt;

    const std::string_view key = strip(body.substr(0, sep));
    std::string_view value = strip(body.substr(sep + 1));
    if (key.empty() || value.empty()) return std::nullopt;

    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }
    return std::make_pair(lower(key), std::string(value));
}

AppConfig load_config_file(const std::string& path) {
    AppConfig cfg;
    std::ifstream in(path);
    if (!in.good()) return cfg;

    const auto& table = setters();
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const auto entry = parse_config_line(line);
        if (!entry) continue;

        const auto it = table.find(entry->first);
        if (it == table.end()) {
            log::debug(path, ":", line_no, ": ignoring unknown key '", entry->first, "'");
            continue;
        }
        it->second(cfg, entry->second);
    }
    return cfg;
}

} // namespace whispercore
