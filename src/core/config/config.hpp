#pragma once
#include <cstddef>
#include <string>

#include "../types/constants.hpp"

namespace Reader {
namespace Core {

struct Config {
    std::string host    = Constants::DEFAULT_HOST;
    int         port    = Constants::DEFAULT_PORT;
    int         threads = Constants::DEFAULT_THREADS;

    int    rate_window      = Constants::DEFAULT_RATE_WINDOW_SECONDS;  // seconds
    int    rate_limit       = Constants::DEFAULT_RATE_LIMIT;
    size_t rate_max_clients = Constants::DEFAULT_RATE_MAX_CLIENTS;

    std::string browser_path;  // empty = auto-detect
    bool        headless = true;

    int    probe_timeout      = Constants::DEFAULT_PROBE_TIMEOUT_MS;       // milliseconds
    int    navigation_timeout = Constants::DEFAULT_NAVIGATION_TIMEOUT_MS;  // milliseconds
    int    launch_timeout     = Constants::DEFAULT_LAUNCH_TIMEOUT_MS;      // milliseconds
    int    max_browsers       = Constants::DEFAULT_MAX_BROWSERS;           // 0 = unlimited
    size_t max_pdf_bytes      = Constants::DEFAULT_MAX_PDF_BYTES;
    size_t max_body_bytes     = Constants::DEFAULT_MAX_BODY_BYTES;

    std::string log_level = "info";
    std::string config_path;

    // Precedence: command line, then YAML file, then environment, then defaults.
    static Config parse(int argc, char* argv[]);
};

void load_yaml(Config& config, const std::string& path);
void load_env(Config& config);

}  // namespace Core
}  // namespace Reader
