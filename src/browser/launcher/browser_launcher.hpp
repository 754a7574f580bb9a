#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

#include "../../core/types/constants.hpp"

namespace Reader {
namespace Browser {
namespace Launcher {

struct LaunchOptions {
    std::string               path;
    bool                      headless = true;
    std::chrono::milliseconds timeout{Core::Constants::DEFAULT_LAUNCH_TIMEOUT_MS};
    std::vector<std::string>  extra_args;
};

// Owns one running browser process and its throwaway profile directory.
// Destruction kills the whole process group and removes the profile.
class BrowserProcess {
public:
    BrowserProcess(pid_t pid, std::string user_data_dir);
    ~BrowserProcess();

    BrowserProcess(const BrowserProcess&)            = delete;
    BrowserProcess& operator=(const BrowserProcess&) = delete;

    void terminate() noexcept;
    bool running() const;

    int devtools_port() const {
        return devtools_port_;
    }
    const std::string& devtools_path() const {
        return devtools_path_;
    }

private:
    friend class BrowserLauncher;

    pid_t       pid_;
    std::string user_data_dir_;
    int         devtools_port_ = 0;
    std::string devtools_path_;
};

class BrowserLauncher {
public:
    static std::string find_browser();

    static std::vector<std::string> build_args(const LaunchOptions& options,
                                               const std::string&   user_data_dir);

    // Starts an isolated browser and waits, without blocking the event loop,
    // for its DevTools endpoint. Throws std::runtime_error on failure; no
    // process is left behind in that case.
    static boost::asio::awaitable<std::unique_ptr<BrowserProcess>>
    launch(const LaunchOptions& options);

private:
    static std::vector<std::string> get_search_paths();
    static bool read_active_port(const std::string& user_data_dir, int& port, std::string& path);
};

}  // namespace Launcher
}  // namespace Browser
}  // namespace Reader
