#pragma once
#include <cstddef>
#include <string>

namespace Reader {
namespace Core {

struct Constants {
    static constexpr const char* VERSION     = "0.1.0";
    static constexpr const char* DEFAULT_HOST = "0.0.0.0";
    static constexpr int         DEFAULT_PORT = 8080;
    static constexpr int         DEFAULT_THREADS = 1;  // IO Threads

    static constexpr int    DEFAULT_RATE_WINDOW_SECONDS = 60;
    static constexpr int    DEFAULT_RATE_LIMIT          = 20;
    static constexpr size_t DEFAULT_RATE_MAX_CLIENTS    = 10000;
    static constexpr int    DEFAULT_RETRY_AFTER_SECONDS = 60;

    static constexpr int    DEFAULT_PROBE_TIMEOUT_MS      = 5000;
    static constexpr int    DEFAULT_NAVIGATION_TIMEOUT_MS = 15000;
    static constexpr int    DEFAULT_LAUNCH_TIMEOUT_MS     = 15000;
    static constexpr int    DEFAULT_MAX_BROWSERS          = 4;
    static constexpr size_t DEFAULT_MAX_PDF_BYTES         = 50 * 1024 * 1024;
    static constexpr size_t DEFAULT_MAX_BODY_BYTES        = 10 * 1024 * 1024;
    static constexpr int    MAX_REDIRECTS                 = 5;

    static constexpr const char* USER_AGENT = "Mozilla/5.0 (compatible; Reader/0.1)";
    static constexpr const char* PDF_MIME   = "application/pdf";
    static constexpr const char* USAGE_TEXT = "Usage: GET /{URL} or POST / with {\"url\":\"...\"}";
};

}  // namespace Core
}  // namespace Reader
