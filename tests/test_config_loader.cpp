#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config_loader.h"

using namespace fm;

namespace {

const char* const kEnvVars[] = {
    "FM_TICK_MS", "FM_HIGHLIGHT_HOLD_SEC", "FM_POPUP_HOLD_SEC", "FM_ACCENT_COLOR",
    "FM_POPUP_COLOR_START", "FM_POPUP_COLOR_END", "FM_LOG_SESSION", "FM_VALIDATION",
};

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kEnvVars) unsetenv(name);
        path_ = ::testing::TempDir() + "flashmark_test_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".cfg";
        std::remove(path_.c_str());
    }

    void TearDown() override {
        for (const char* name : kEnvVars) unsetenv(name);
        std::remove(path_.c_str());
    }

    void write_file(const std::string& body) {
        std::ofstream out(path_);
        out << body;
    }

    AppConfigManager load() {
        AppConfigManager manager{AppConfig{}};
        manager.set_cli_config_path(path_);
        manager.reload();
        return manager;
    }

    std::string path_;
};

} // namespace

TEST(ParseRgbTest, AcceptsTriples) {
    EXPECT_EQ(parse_rgb("0,122,255"), (ui::Rgb8{0, 122, 255}));
    EXPECT_EQ(parse_rgb(" 1 , 2 , 3 "), (ui::Rgb8{1, 2, 3}));
    EXPECT_EQ(format_rgb(ui::Rgb8{38, 77, 191}), "38,77,191");
}

TEST(ParseRgbTest, RejectsMalformed) {
    EXPECT_THROW(parse_rgb("1,2"), std::invalid_argument);
    EXPECT_THROW(parse_rgb("1,2,3,4"), std::invalid_argument);
    EXPECT_THROW(parse_rgb("1,2,256"), std::invalid_argument);
    EXPECT_THROW(parse_rgb("1,-2,3"), std::invalid_argument);
    EXPECT_THROW(parse_rgb("1,2,blue"), std::invalid_argument);
    EXPECT_THROW(parse_rgb("1,2,3x"), std::invalid_argument);
}

TEST_F(ConfigLoaderTest, MissingFileKeepsDefaults) {
    const AppConfigManager manager = load();
    EXPECT_FALSE(manager.has_config_file());
    AppConfig expected;
    expected.config_path = path_;
    EXPECT_EQ(manager.active(), expected);
    EXPECT_EQ(manager.config_path(), path_);
}

TEST_F(ConfigLoaderTest, FileOverridesDefaults) {
    write_file("# comment\n"
               "tick_ms = 5\n"
               "highlight_hold_sec=1.5\n"
               "ACCENT_COLOR=255,0,0\n"
               "log_session=yes\n");
    const AppConfigManager manager = load();
    EXPECT_TRUE(manager.has_config_file());
    const AppConfig& cfg = manager.active();
    EXPECT_EQ(cfg.tick_ms, 5);
    EXPECT_DOUBLE_EQ(cfg.highlight_hold_sec, 1.5);
    EXPECT_DOUBLE_EQ(cfg.popup_hold_sec, 3.1);
    EXPECT_EQ(cfg.accent_color, (ui::Rgb8{255, 0, 0}));
    EXPECT_TRUE(cfg.log_session);
    EXPECT_FALSE(cfg.validation);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    write_file("tick_ms=5\npopup_hold_sec=2\n");
    setenv("FM_TICK_MS", "8", 1);
    setenv("FM_VALIDATION", "on", 1);
    const AppConfigManager manager = load();
    EXPECT_EQ(manager.file_layer().tick_ms, 5);
    EXPECT_EQ(manager.active().tick_ms, 8);
    EXPECT_DOUBLE_EQ(manager.active().popup_hold_sec, 2.0);
    EXPECT_TRUE(manager.active().validation);
}

TEST_F(ConfigLoaderTest, MalformedValuesAreIgnored) {
    write_file("tick_ms=fast\n"
               "popup_hold_sec=-3\n"
               "popup_color_end=1,2\n"
               "log_session=maybe\n"
               "no equals sign here\n"
               "unknown_key=1\n"
               "validation=true\n");
    const AppConfigManager manager = load();
    const AppConfig& cfg = manager.active();
    const AppConfig defaults;
    EXPECT_EQ(cfg.tick_ms, defaults.tick_ms);
    EXPECT_DOUBLE_EQ(cfg.popup_hold_sec, defaults.popup_hold_sec);
    EXPECT_EQ(cfg.popup_color_end, defaults.popup_color_end);
    EXPECT_EQ(cfg.log_session, defaults.log_session);
    EXPECT_TRUE(cfg.validation);
}

TEST_F(ConfigLoaderTest, TickIntervalIsClamped) {
    write_file("tick_ms=100\n");
    EXPECT_EQ(load().active().tick_ms, 16);

    write_file("tick_ms=0\n");
    EXPECT_EQ(load().active().tick_ms, 1);
}

TEST_F(ConfigLoaderTest, ReloadReportsChanges) {
    write_file("tick_ms=5\n");
    AppConfigManager manager{AppConfig{}};
    manager.set_cli_config_path(path_);
    EXPECT_TRUE(manager.reload());
    EXPECT_FALSE(manager.reload());

    write_file("tick_ms=6\n");
    EXPECT_TRUE(manager.reload());
    EXPECT_EQ(manager.active().tick_ms, 6);
}

TEST_F(ConfigLoaderTest, WrittenConfigReadsBack) {
    AppConfig cfg;
    cfg.tick_ms = 12;
    cfg.popup_hold_sec = 4.5;
    cfg.popup_color_start = ui::Rgb8{1, 2, 3};
    cfg.log_session = true;
    {
        std::ofstream out(path_);
        write_config_file(out, cfg);
    }
    cfg.config_path = path_;
    EXPECT_EQ(load().active(), cfg);
}

TEST_F(ConfigLoaderTest, ProgressLinesGoToLogStream) {
    write_file("tick_ms=5\n");
    setenv("FM_LOG_SESSION", "true", 1);
    std::ostringstream log;
    AppConfigManager manager{AppConfig{}};
    manager.set_cli_config_path(path_);
    manager.set_log_stream(log);

    ::testing::internal::CaptureStdout();
    manager.reload();
    std::ostringstream printed;
    write_config_file(printed, manager.active());
    const std::string stdout_text = ::testing::internal::GetCapturedStdout();

    EXPECT_TRUE(stdout_text.empty()) << stdout_text;
    EXPECT_NE(log.str().find("[config] reading " + path_), std::string::npos);
    EXPECT_NE(log.str().find("[config] tick_ms=5 (file)"), std::string::npos);
    EXPECT_NE(log.str().find("[config] log_session=true (env)"), std::string::npos);
    EXPECT_EQ(printed.str().find("[config]"), std::string::npos);

    // The printed config is a loadable file on its own.
    {
        std::ofstream out(path_);
        out << printed.str();
    }
    unsetenv("FM_LOG_SESSION");
    EXPECT_TRUE(load().active().log_session);
    EXPECT_EQ(load().active().tick_ms, 5);
}
