#include "config_loader.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

namespace fm {
namespace {

constexpr int kMinTickMs = 1;
constexpr int kMaxTickMs = 16;

std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool parse_bool(const std::string& text) {
    const std::string v = lower(trim(text));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument("expected a boolean, got '" + text + "'");
}

int parse_tick_ms(const std::string& text) {
    return std::clamp(std::stoi(text), kMinTickMs, kMaxTickMs);
}

double parse_seconds(const std::string& text) {
    const double v = std::stod(text);
    if (!std::isfinite(v) || v < 0.0) throw std::out_of_range("duration must be a non-negative number");
    return v;
}

std::string bool_string(bool v) {
    return v ? "true" : "false";
}

std::string value_string(bool v) { return bool_string(v); }
std::string value_string(const ui::Rgb8& v) { return format_rgb(v); }
template <typename T>
std::string value_string(const T& v) {
    std::ostringstream os;
    os << v;
    return os.str();
}

// A throwing parse leaves the field untouched.
template <typename T, typename Parse>
bool assign_value(std::ostream& log, const char* key, const std::string& text, T& field, Parse&& parse,
                  const char* source) {
    try {
        field = parse(text);
    } catch (const std::exception& e) {
        std::cerr << "[config] ignoring " << key << "='" << text << "' (" << source << "): " << e.what() << "\n";
        return false;
    }
    log << "[config] " << key << "=" << value_string(field) << " (" << source << ")\n";
    return true;
}

template <typename Fn>
bool apply_key(std::ostream& log, AppConfig& cfg, const std::string& key, const std::string& val, const char* source,
               Fn&& on_unknown) {
    if (key == "tick_ms") return assign_value(log, "tick_ms", val, cfg.tick_ms, parse_tick_ms, source);
    if (key == "highlight_hold_sec") return assign_value(log, "highlight_hold_sec", val, cfg.highlight_hold_sec, parse_seconds, source);
    if (key == "popup_hold_sec") return assign_value(log, "popup_hold_sec", val, cfg.popup_hold_sec, parse_seconds, source);
    if (key == "accent_color") return assign_value(log, "accent_color", val, cfg.accent_color, parse_rgb, source);
    if (key == "popup_color_start") return assign_value(log, "popup_color_start", val, cfg.popup_color_start, parse_rgb, source);
    if (key == "popup_color_end") return assign_value(log, "popup_color_end", val, cfg.popup_color_end, parse_rgb, source);
    if (key == "log_session") return assign_value(log, "log_session", val, cfg.log_session, parse_bool, source);
    if (key == "validation") return assign_value(log, "validation", val, cfg.validation, parse_bool, source);
    on_unknown(key);
    return false;
}

bool apply_file_overrides(std::ostream& log, const std::string& path, AppConfig& cfg) {
    if (path.empty()) {
        return false;
    }

    std::ifstream in(path);
    if (!in.good()) {
        log << "[config] config file not found: " << path << " (using defaults/env)\n";
        return false;
    }

    log << "[config] reading " << path << "\n";

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "[config] " << path << ":" << line_no << ": expected key=value\n";
            continue;
        }
        const std::string key = lower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));
        apply_key(log, cfg, key, val, "file", [&](const std::string& k) {
            std::cerr << "[config] " << path << ":" << line_no << ": unknown key '" << k << "'\n";
        });
    }

    return true;
}

void apply_env_overrides(std::ostream& log, AppConfig& cfg) {
    static const char* const kKeys[] = {
        "tick_ms", "highlight_hold_sec", "popup_hold_sec", "accent_color",
        "popup_color_start", "popup_color_end", "log_session", "validation",
    };
    for (const char* key : kKeys) {
        std::string env_name = "FM_";
        for (const char* p = key; *p; ++p) env_name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(*p))));
        if (const char* s = std::getenv(env_name.c_str())) {
            apply_key(log, cfg, key, s, "env", [](const std::string&) {});
        }
    }
}

} // namespace

ui::Rgb8 parse_rgb(const std::string& text) {
    std::stringstream ss(text);
    std::string part;
    int channels[3] = {0, 0, 0};
    int count = 0;
    while (std::getline(ss, part, ',')) {
        if (count == 3) throw std::invalid_argument("expected r,g,b");
        part = trim(part);
        std::size_t used = 0;
        const int v = std::stoi(part, &used);
        if (used != part.size() || v < 0 || v > 255) throw std::invalid_argument("color channel out of range 0..255");
        channels[count++] = v;
    }
    if (count != 3) throw std::invalid_argument("expected r,g,b");
    return ui::Rgb8{static_cast<std::uint8_t>(channels[0]), static_cast<std::uint8_t>(channels[1]),
                    static_cast<std::uint8_t>(channels[2])};
}

std::string format_rgb(const ui::Rgb8& c) {
    return std::to_string(c.r) + "," + std::to_string(c.g) + "," + std::to_string(c.b);
}

void write_config_file(std::ostream& out, const AppConfig& cfg) {
    out << "# Flashmark configuration\n";
    out << "# Every key can also be set through FM_<KEY> in the environment\n\n";

    out << "tick_ms=" << cfg.tick_ms << '\n';
    out << "highlight_hold_sec=" << cfg.highlight_hold_sec << '\n';
    out << "popup_hold_sec=" << cfg.popup_hold_sec << '\n';
    out << "accent_color=" << format_rgb(cfg.accent_color) << '\n';
    out << "popup_color_start=" << format_rgb(cfg.popup_color_start) << '\n';
    out << "popup_color_end=" << format_rgb(cfg.popup_color_end) << '\n';
    out << "log_session=" << bool_string(cfg.log_session) << '\n';
    out << "validation=" << bool_string(cfg.validation) << '\n';
}

bool operator==(const AppConfig& a, const AppConfig& b) {
    return std::tie(a.tick_ms, a.highlight_hold_sec, a.popup_hold_sec, a.accent_color, a.popup_color_start,
                    a.popup_color_end, a.log_session, a.validation, a.config_path) ==
           std::tie(b.tick_ms, b.highlight_hold_sec, b.popup_hold_sec, b.accent_color, b.popup_color_start,
                    b.popup_color_end, b.log_session, b.validation, b.config_path);
}

bool operator!=(const AppConfig& a, const AppConfig& b) {
    return !(a == b);
}

AppConfigManager::AppConfigManager(AppConfig defaults)
    : defaults_(std::move(defaults)),
      after_file_(defaults_),
      after_env_(defaults_),
      active_(defaults_),
      log_(&std::cout) {
    resolved_config_path_ = defaults_.config_path;
}

void AppConfigManager::set_cli_config_path(std::string path) {
    cli_config_path_ = std::move(path);
}

void AppConfigManager::set_log_stream(std::ostream& log) {
    log_ = &log;
}

bool AppConfigManager::apply_file_layer(AppConfig& cfg) {
    if (apply_file_overrides(*log_, resolved_config_path_, cfg)) {
        file_layer_loaded_ = true;
        after_file_ = cfg;
        return true;
    }
    file_layer_loaded_ = false;
    after_file_ = defaults_;
    return false;
}

void AppConfigManager::apply_env_layer(AppConfig& cfg) {
    apply_env_overrides(*log_, cfg);
    after_env_ = cfg;
}

bool AppConfigManager::rebuild_active(const AppConfig& base) {
    bool changed = (active_ != base);
    active_ = base;
    return changed;
}

bool AppConfigManager::reload() {
    resolved_config_path_ = cli_config_path_.empty() ? defaults_.config_path : cli_config_path_;

    AppConfig merged = defaults_;
    apply_file_layer(merged);
    apply_env_layer(merged);
    merged.config_path = resolved_config_path_;
    return rebuild_active(merged);
}

} // namespace fm
