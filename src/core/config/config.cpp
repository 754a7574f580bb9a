#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "../../utils/text/string_utils.hpp"

namespace Reader {
namespace Core {

void load_env(Config& config) {
    if (const char* port = std::getenv("PORT"); port && *port) {
        try {
            config.port = std::stoi(port);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid PORT environment variable: " + std::string(port));
        }
    }

    if (const char* path = std::getenv("OVERRIDE_CHROME_EXECUTABLE_PATH"); path && *path)
        config.browser_path = path;

    if (const char* debug = std::getenv("DEBUG_BROWSER"); debug && *debug) {
        std::string value = Utils::Text::to_lower(debug);
        if (value != "0" && value != "false" && value != "no")
            config.headless = false;
    }
}

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["host"])
            config.host = yaml["host"].as<std::string>();
        if (yaml["port"])
            config.port = yaml["port"].as<int>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["rate_window"])
            config.rate_window = yaml["rate_window"].as<int>();
        if (yaml["rate_limit"])
            config.rate_limit = yaml["rate_limit"].as<int>();
        if (yaml["rate_max_clients"])
            config.rate_max_clients = yaml["rate_max_clients"].as<size_t>();
        if (yaml["browser_path"])
            config.browser_path = yaml["browser_path"].as<std::string>();
        if (yaml["headless"])
            config.headless = yaml["headless"].as<bool>();
        if (yaml["probe_timeout"])
            config.probe_timeout = yaml["probe_timeout"].as<int>();
        if (yaml["navigation_timeout"])
            config.navigation_timeout = yaml["navigation_timeout"].as<int>();
        if (yaml["launch_timeout"])
            config.launch_timeout = yaml["launch_timeout"].as<int>();
        if (yaml["max_browsers"])
            config.max_browsers = yaml["max_browsers"].as<int>();
        if (yaml["max_pdf_bytes"])
            config.max_pdf_bytes = yaml["max_pdf_bytes"].as<size_t>();
        if (yaml["max_body_bytes"])
            config.max_body_bytes = yaml["max_body_bytes"].as<size_t>();
        if (yaml["log_level"])
            config.log_level = yaml["log_level"].as<std::string>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Reader - URL to Markdown service for web pages and PDF documents"};
    app.set_version_flag("--version", std::string(Constants::VERSION));

    load_env(config);

    app.add_option("--host", config.host, "Bind address");
    app.add_option("-p,--port", config.port, "Listen port (env PORT)");
    app.add_option("--threads", config.threads, "Number of IO threads")->check(CLI::PositiveNumber);
    app.add_option("--rate-window", config.rate_window, "Rate limit window in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--rate-limit", config.rate_limit, "Requests allowed per client and window")
        ->check(CLI::PositiveNumber);
    app.add_option("--rate-max-clients", config.rate_max_clients, "Max clients tracked at once")
        ->check(CLI::PositiveNumber);
    app.add_option("--browser",
                   config.browser_path,
                   "Path to Chromium/Chrome executable (env OVERRIDE_CHROME_EXECUTABLE_PATH)");
    app.add_flag(
        "--no-headless",
        [&](size_t count) {
            if (count > 0)
                config.headless = false;
        },
        "Run browser in windowed mode (debug only, env DEBUG_BROWSER)");
    app.add_option("--probe-timeout", config.probe_timeout, "PDF probe timeout in ms")
        ->check(CLI::PositiveNumber);
    app.add_option("--nav-timeout", config.navigation_timeout, "Page navigation timeout in ms")
        ->check(CLI::PositiveNumber);
    app.add_option("--launch-timeout", config.launch_timeout, "Browser startup timeout in ms")
        ->check(CLI::PositiveNumber);
    app.add_option("--max-browsers", config.max_browsers, "Concurrent browsers, 0 = unlimited")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--max-pdf-bytes", config.max_pdf_bytes, "Largest PDF accepted, in bytes");
    app.add_option("--max-body-bytes", config.max_body_bytes, "Largest request body, in bytes");
    app.add_option("--log-level", config.log_level, "debug, info, warn, error or none")
        ->check(CLI::IsMember({"debug", "info", "warn", "error", "none"}));
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    return config;
}

}  // namespace Core
}  // namespace Reader
