#pragma once

#include <iosfwd>
#include <string>

#include "ui/ui_types.h"

namespace fm {

struct AppConfig {
    int tick_ms = 10;
    double highlight_hold_sec = 2.8;
    double popup_hold_sec = 3.1;

    ui::Rgb8 accent_color{0, 122, 255};
    ui::Rgb8 popup_color_start{38, 77, 191};
    ui::Rgb8 popup_color_end{89, 64, 179};

    bool log_session = false;
    bool validation = false;

    std::string config_path = "flashmark.cfg";
};

bool operator==(const AppConfig& a, const AppConfig& b);
bool operator!=(const AppConfig& a, const AppConfig& b);

// "r,g,b" with each component 0..255; throws std::invalid_argument otherwise.
ui::Rgb8 parse_rgb(const std::string& text);
std::string format_rgb(const ui::Rgb8& c);

void write_config_file(std::ostream& out, const AppConfig& cfg);

// defaults -> config file -> FM_* environment.
class AppConfigManager {
public:
    explicit AppConfigManager(AppConfig defaults);

    void set_cli_config_path(std::string path);
    // Where "[config]" progress lines go; std::cout unless redirected. Rejected values always go to std::cerr.
    void set_log_stream(std::ostream& log);

    bool reload();

    const AppConfig& defaults() const { return defaults_; }
    const AppConfig& file_layer() const { return after_file_; }
    const AppConfig& env_layer() const { return after_env_; }
    const AppConfig& active() const { return active_; }
    const std::string& config_path() const { return resolved_config_path_; }
    bool has_config_file() const { return file_layer_loaded_; }

private:
    bool apply_file_layer(AppConfig& cfg);
    void apply_env_layer(AppConfig& cfg);
    bool rebuild_active(const AppConfig& base);

    AppConfig defaults_{};
    AppConfig after_file_{};
    AppConfig after_env_{};
    AppConfig active_{};

    std::string cli_config_path_;
    std::string resolved_config_path_;
    bool file_layer_loaded_ = false;
    std::ostream* log_;
};

} // namespace fm
