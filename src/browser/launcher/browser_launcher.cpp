#include "browser_launcher.hpp"
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Reader {
namespace Browser {
namespace Launcher {

using namespace Reader::Core;

namespace {
constexpr int  STARTUP_POLL_INTERVAL_MS = 50;
constexpr char PROFILE_TEMPLATE[]       = "reader-browser-XXXXXX";

std::string make_profile_dir() {
    std::string pattern =
        (std::filesystem::temp_directory_path() / PROFILE_TEMPLATE).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("Cannot create browser profile directory: "
                                 + std::string(std::strerror(errno)));
    }
    return std::string(buffer.data());
}

void remove_profile_dir(const std::string& dir) {
    if (dir.empty())
        return;
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec)
        Logger::warn("Browser: could not remove profile " + dir + ": " + ec.message());
}
}  // namespace

BrowserProcess::BrowserProcess(pid_t pid, std::string user_data_dir)
    : pid_(pid), user_data_dir_(std::move(user_data_dir)) {
}

BrowserProcess::~BrowserProcess() {
    terminate();
}

bool BrowserProcess::running() const {
    if (pid_ <= 0)
        return false;
    return ::waitpid(pid_, nullptr, WNOHANG) == 0;
}

void BrowserProcess::terminate() noexcept {
    if (pid_ > 0) {
        Logger::info("Closing headless browser (PID: " + std::to_string(pid_) + ")...");
        // The browser leads its own process group; renderer and GPU helpers go with it.
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
        while (::waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {
        }
        pid_ = -1;
    }
    remove_profile_dir(user_data_dir_);
    user_data_dir_.clear();
}

std::vector<std::string> BrowserLauncher::get_search_paths() {
    return {"/usr/bin/chromium",
            "/usr/bin/chromium-browser",
            "/usr/bin/google-chrome",
            "/usr/bin/google-chrome-stable",
            "/snap/bin/chromium",
            "/usr/local/bin/chromium",
            "chromium",
            "chromium-browser",
            "google-chrome"};
}

std::string BrowserLauncher::find_browser() {
    for (const auto& path : get_search_paths()) {
        if (path.find('/') != std::string::npos) {
            if (::access(path.c_str(), X_OK) == 0)
                return path;
            continue;
        }

        const char* env_path = std::getenv("PATH");
        if (!env_path)
            continue;
        for (const auto& dir : Utils::Text::split(env_path, ':')) {
            if (dir.empty())
                continue;
            std::string candidate = dir + "/" + path;
            if (::access(candidate.c_str(), X_OK) == 0)
                return candidate;
        }
    }
    return "";
}

std::vector<std::string> BrowserLauncher::build_args(const LaunchOptions& options,
                                                     const std::string&   user_data_dir) {
    std::vector<std::string> args = {options.path,
                                     "--headless",
                                     "--no-sandbox",
                                     "--disable-dev-shm-usage",
                                     "--disable-blink-features=AutomationControlled",
                                     "--disable-gpu",
                                     "--disable-extensions",
                                     "--no-first-run",
                                     "--no-default-browser-check",
                                     "--hide-scrollbars",
                                     "--mute-audio",
                                     "--window-size=1920,1080",
                                     "--remote-debugging-port=0",
                                     "--user-data-dir=" + user_data_dir};

    if (!options.headless)
        args.erase(args.begin() + 1);

    args.insert(args.end(), options.extra_args.begin(), options.extra_args.end());
    args.push_back("about:blank");
    return args;
}

bool BrowserLauncher::read_active_port(const std::string& user_data_dir,
                                       int&               port,
                                       std::string&       path) {
    std::ifstream file(user_data_dir + "/DevToolsActivePort");
    if (!file)
        return false;

    std::string port_line;
    std::string path_line;
    if (!std::getline(file, port_line) || !std::getline(file, path_line))
        return false;

    port_line = Utils::Text::trim(port_line);
    path_line = Utils::Text::trim(path_line);
    if (port_line.empty() || path_line.empty())
        return false;

    try {
        port = std::stoi(port_line);
    } catch (const std::exception&) {
        return false;
    }
    path = path_line;
    return port > 0;
}

boost::asio::awaitable<std::unique_ptr<BrowserProcess>>
BrowserLauncher::launch(const LaunchOptions& options) {
    if (options.path.empty() || ::access(options.path.c_str(), X_OK) != 0) {
        throw std::runtime_error("Browser path does not exist or is not executable: "
                                 + options.path);
    }

    std::string user_data_dir = make_profile_dir();
    auto        arg_strings   = build_args(options, user_data_dir);

    std::vector<char*> argv;
    for (auto& s : arg_strings)
        argv.push_back(s.data());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        remove_profile_dir(user_data_dir);
        throw std::runtime_error("fork failed: " + std::string(std::strerror(errno)));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO)
                ::close(devnull);
        }
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }

    // Set from both sides so the group exists before we might signal it.
    ::setpgid(pid, pid);

    auto process = std::make_unique<BrowserProcess>(pid, user_data_dir);
    Logger::info("Launched headless browser: " + options.path + " (PID: " + std::to_string(pid)
                 + ")");

    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;

    while (true) {
        int         port = 0;
        std::string path;
        if (read_active_port(user_data_dir, port, path)) {
            process->devtools_port_ = port;
            process->devtools_path_ = path;
            Logger::debug("Browser: DevTools listening on 127.0.0.1:" + std::to_string(port)
                          + path);
            co_return process;
        }

        if (!process->running()) {
            process->pid_ = -1;
            throw std::runtime_error("Browser exited during startup");
        }

        if (std::chrono::steady_clock::now() >= deadline)
            throw std::runtime_error("Browser did not expose DevTools within "
                                     + std::to_string(options.timeout.count()) + "ms");

        timer.expires_after(std::chrono::milliseconds(STARTUP_POLL_INTERVAL_MS));
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
}

}  // namespace Launcher
}  // namespace Browser
}  // namespace Reader
