#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/config/config.hpp"

using namespace Reader::Core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        unsetenv("PORT");
        unsetenv("OVERRIDE_CHROME_EXECUTABLE_PATH");
        unsetenv("DEBUG_BROWSER");
    }
};

TEST_F(ConfigTest, Defaults) {
    char* argv[] = {(char*)"reader"};
    auto  config = Config::parse(1, argv);
    EXPECT_EQ(config.port, Constants::DEFAULT_PORT);
    EXPECT_EQ(config.rate_limit, 20);
    EXPECT_EQ(config.rate_window, 60);
    EXPECT_TRUE(config.headless);
    EXPECT_TRUE(config.browser_path.empty());
    EXPECT_EQ(config.log_level, "info");
}

TEST_F(ConfigTest, ComplexCLI) {
    char* argv[] = {(char*)"reader",
                    (char*)"--port",
                    (char*)"9000",
                    (char*)"--threads",
                    (char*)"8",
                    (char*)"--rate-limit",
                    (char*)"5",
                    (char*)"--rate-window",
                    (char*)"30",
                    (char*)"--no-headless",
                    (char*)"--browser",
                    (char*)"/opt/chrome/chrome",
                    (char*)"--log-level",
                    (char*)"debug"};
    auto  config = Config::parse(14, argv);
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.threads, 8);
    EXPECT_EQ(config.rate_limit, 5);
    EXPECT_EQ(config.rate_window, 30);
    EXPECT_FALSE(config.headless);
    EXPECT_EQ(config.browser_path, "/opt/chrome/chrome");
    EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ConfigTest, YamlLoading) {
    std::string   yaml_content = R"(
        host: "127.0.0.1"
        port: 8088
        rate_limit: 50
        rate_max_clients: 500
        headless: false
        navigation_timeout: 15000
        max_browsers: 2
        log_level: warn
    )";
    std::ofstream ofs("test_config.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {(char*)"reader", (char*)"--config", (char*)"test_config.yaml"};
    auto  config = Config::parse(3, argv);

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 8088);
    EXPECT_EQ(config.rate_limit, 50);
    EXPECT_EQ(config.rate_max_clients, 500u);
    EXPECT_FALSE(config.headless);
    EXPECT_EQ(config.navigation_timeout, 15000);
    EXPECT_EQ(config.max_browsers, 2);
    EXPECT_EQ(config.log_level, "warn");

    std::remove("test_config.yaml");
}

TEST_F(ConfigTest, CliOverridesYaml) {
    std::ofstream ofs("test_ovr.yaml");
    ofs << "port: 8088\nrate_limit: 50";
    ofs.close();

    char* argv[] = {
        (char*)"reader", (char*)"--config", (char*)"test_ovr.yaml", (char*)"--port", (char*)"7000"};
    auto config = Config::parse(5, argv);

    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.rate_limit, 50);

    std::remove("test_ovr.yaml");
}

TEST_F(ConfigTest, EnvironmentPort) {
    setenv("PORT", "4321", 1);
    char* argv[] = {(char*)"reader"};
    EXPECT_EQ(Config::parse(1, argv).port, 4321);

    char* argv_cli[] = {(char*)"reader", (char*)"--port", (char*)"5555"};
    EXPECT_EQ(Config::parse(3, argv_cli).port, 5555);
}

TEST_F(ConfigTest, InvalidEnvironmentPort) {
    setenv("PORT", "not-a-port", 1);
    char* argv[] = {(char*)"reader"};
    EXPECT_THROW(Config::parse(1, argv), std::runtime_error);
}

TEST_F(ConfigTest, BrowserEnvironment) {
    setenv("OVERRIDE_CHROME_EXECUTABLE_PATH", "/usr/bin/chromium", 1);
    setenv("DEBUG_BROWSER", "1", 1);

    Config config;
    load_env(config);
    EXPECT_EQ(config.browser_path, "/usr/bin/chromium");
    EXPECT_FALSE(config.headless);
}

TEST_F(ConfigTest, DebugBrowserFalseKeepsHeadless) {
    setenv("DEBUG_BROWSER", "false", 1);
    Config config;
    load_env(config);
    EXPECT_TRUE(config.headless);
}

TEST_F(ConfigTest, InvalidYaml) {
    std::ofstream ofs("invalid.yaml");
    ofs << "port: [not an integer]";
    ofs.close();

    const char* argv[] = {"reader", "--config", "invalid.yaml"};
    EXPECT_THROW(Config::parse(3, (char**)argv), std::runtime_error);
    std::remove("invalid.yaml");
}

TEST_F(ConfigTest, NonExistentFile) {
    const char* argv[] = {"reader", "--config", "does_not_exist.yaml"};
    EXPECT_THROW(Config::parse(3, (char**)argv), std::runtime_error);
}

TEST_F(ConfigTest, EmptyConfig) {
    std::ofstream ofs("empty.yaml");
    ofs << "";
    ofs.close();

    char* argv[] = {(char*)"reader", (char*)"--config", (char*)"empty.yaml"};
    auto  config = Config::parse(3, argv);
    EXPECT_EQ(config.rate_limit, 20);

    std::remove("empty.yaml");
}
