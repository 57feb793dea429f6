#include <CLI/CLI.hpp>

#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "config_loader.h"
#include "geometry_resolver.h"
#include "overlay_error.h"
#include "overlay_session.h"
#include "platform_layer.h"
#include "screen_enumerator.h"
#include "ui/ui_text.h"
#include "vulkan_presenter.h"

namespace {

fm::RenderStyle style_from_config(const fm::AppConfig& cfg) {
    fm::RenderStyle style;
    style.accent = cfg.accent_color;
    style.popup_start = cfg.popup_color_start;
    style.popup_end = cfg.popup_color_end;
    return style;
}

fm::SessionConfig session_from_config(const fm::AppConfig& cfg) {
    fm::SessionConfig session;
    session.tick_interval = std::chrono::milliseconds(cfg.tick_ms);
    session.log_transitions = cfg.log_session;
    return session;
}

int show_overlay(fm::PlatformLayer& platform, const std::vector<fm::ScreenGeometry>& screens,
                 const fm::Rect& target, const std::string* message, const fm::AppConfig& cfg) {
    fm::ui::BitmapFontMeasurer font;

    fm::OverlayPlan plan;
    if (message) {
        fm::FadeProfile profile = fm::FadeProfile::popup();
        profile.hold_s = cfg.popup_hold_sec;
        plan = fm::plan_popup(*message, target, fm::resolve_screen(target, screens), font, profile);
    } else {
        fm::FadeProfile profile = fm::FadeProfile::highlight();
        profile.hold_s = cfg.highlight_hold_sec;
        plan = fm::plan_highlight(target, screens, profile);
    }

    fm::GlfwVulkanPresenter presenter(platform);
    fm::GlfwVulkanPresenter::CreateInfo info;
    info.window.placement = plan.placement;
    info.window.title = "flashmark";
    info.enable_validation = cfg.validation;
    presenter.initialize(info);

    fm::OverlaySession session(std::move(plan), font, presenter, style_from_config(cfg), session_from_config(cfg));
    const int rc = session.run([&presenter] { return presenter.pump_events(); });
    if (cfg.log_session) {
        std::cout << "[present] " << presenter.frames_presented() << " frames presented\n";
    }
    return rc;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App cli{"Flashmark: flash a highlight or a text popup over a screen rectangle"};
    std::vector<int> rect;
    std::string message;
    std::string config_path_cli;
    bool list_screens = false;
    bool print_config = false;
    bool validation = false;

    cli.add_option("rect", rect, "Target rectangle in desktop coordinates: x y width height")->expected(4);
    auto opt_message = cli.add_option("-m,--message", message,
        "Show a text popup anchored on the rectangle instead of highlighting it");
    auto opt_config = cli.add_option("-c,--config", config_path_cli,
        "Path to flashmark.cfg file (defaults to flashmark.cfg in current directory)");
    cli.add_flag("--list-screens", list_screens, "Print the connected screens and exit");
    cli.add_flag("--print-config", print_config, "Print the active configuration and exit");
    cli.add_flag("--validation", validation, "Enable Vulkan validation layers");
    cli.footer("Use -- before the rectangle if your CLI11 treats negative coordinates as options.");

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = cli.exit(e);
        return rc == 0 ? 0 : fm::exit_code(fm::ErrorCode::InvalidArguments);
    }

    fm::AppConfigManager config{fm::AppConfig{}};
    // Keep stdout clean for the printed config.
    if (print_config) config.set_log_stream(std::cerr);
    if (opt_config->count() > 0) {
        config.set_cli_config_path(config_path_cli);
    }
    config.reload();
    fm::AppConfig cfg = config.active();
    if (validation) cfg.validation = true;

    if (print_config) {
        fm::write_config_file(std::cout, cfg);
        return 0;
    }
    if (!list_screens && rect.size() != 4) {
        std::cerr << "Expected a target rectangle: x y width height\n" << cli.help();
        return fm::exit_code(fm::ErrorCode::InvalidArguments);
    }

    try {
        fm::PlatformLayer platform;
        platform.initialize();
        const std::vector<fm::ScreenGeometry> screens = platform.screens();
        if (list_screens) {
            fm::print_screens(std::cout, screens);
            return 0;
        }
        if (screens.empty()) {
            throw fm::OverlayError(fm::ErrorCode::NoScreenFound, "No monitors connected");
        }

        const fm::Rect target = fm::make_rect(rect[0], rect[1], rect[2], rect[3]);
        if (!fm::within_coordinate_range(target)) {
            throw fm::OverlayError(fm::ErrorCode::InvalidArguments, "Target rectangle is outside the supported coordinate range");
        }
        return show_overlay(platform, screens, target, opt_message->count() > 0 ? &message : nullptr, cfg);
    } catch (const fm::OverlayError& e) {
        std::cerr << "[error] " << fm::to_string(e.code()) << ": " << e.what() << "\n";
        return fm::exit_code(e.code());
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
}
