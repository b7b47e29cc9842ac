#include "browser_launcher.hpp"
#include <algorithm>
#include <csignal>
#include <curl/curl.h>
#include <thread>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace Folio {
namespace Browser {
namespace Launcher {

BrowserLauncher::BrowserLauncher(Core::LoggerPtr logger) : logger_(logger) {
}

BrowserLauncher::~BrowserLauncher() {
    stop();
}

std::vector<std::string> BrowserLauncher::get_search_paths() {
#ifdef __APPLE__
    return {"/Applications/Google Chrome.app/Contents/MacOS/Google Chrome",
            "/Applications/Chromium.app/Contents/MacOS/Chromium",
            "/opt/homebrew/bin/chromium",
            "/usr/local/bin/chromium"};
#else
    return {"/usr/bin/google-chrome",
            "/usr/bin/google-chrome-stable",
            "/usr/bin/chromium-browser",
            "/usr/bin/chromium",
            "/snap/bin/chromium"};
#endif
}

std::string BrowserLauncher::find_browser() {
    for (const auto& path : get_search_paths()) {
        if (std::filesystem::exists(path))
            return path;
    }
    return "";
}

bool BrowserLauncher::endpoint_ready() const {
    CURL* curl = curl_easy_init();
    if (!curl)
        return false;

    std::string url = "http://127.0.0.1:" + std::to_string(port_) + "/json/version";
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 500L);
    CURLcode res  = curl_easy_perform(curl);
    long     code = 0;
    if (res == CURLE_OK)
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_easy_cleanup(curl);
    return res == CURLE_OK && code == 200;
}

bool BrowserLauncher::launch(const std::string&        path,
                             int                       port,
                             bool                      headless,
                             std::chrono::milliseconds ready_timeout) {
    if (running())
        return true;

    if (!std::filesystem::exists(path)) {
        logger_->error("Browser path does not exist: " + path);
        return false;
    }

    port_          = port;
    user_data_dir_ = std::filesystem::temp_directory_path()
                     / ("folio_browser_" + std::to_string(::getpid()) + "_" + std::to_string(port));
    std::error_code ec;
    std::filesystem::create_directories(user_data_dir_, ec);

    std::vector<std::string> arg_strings = {path,
                                            "--headless=new",
                                            "--disable-gpu",
                                            "--disable-extensions",
                                            "--disable-backgrounding-occluded-windows",
                                            "--disable-renderer-backgrounding",
                                            "--window-size=1920,1080",
                                            "--hide-scrollbars",
                                            "--disable-notifications",
                                            "--no-first-run",
                                            "--no-sandbox",
                                            "--remote-debugging-port=" + std::to_string(port),
                                            "--user-data-dir=" + user_data_dir_.string(),
                                            "--remote-allow-origins=*"};

    if (!headless) {
        auto it = std::find(arg_strings.begin(), arg_strings.end(), "--headless=new");
        if (it != arg_strings.end())
            arg_strings.erase(it);
    }

    std::vector<char*> args;
    for (auto& s : arg_strings)
        args.push_back(s.data());
    args.push_back(nullptr);

    pid_t parent = ::getpid();
    pid_         = fork();
    if (pid_ < 0) {
        logger_->error("Failed to fork browser process");
        return false;
    }

    if (pid_ == 0) {
#ifdef __linux__
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        if (::getppid() != parent)
            _exit(1);
#endif
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        execv(path.c_str(), args.data());
        _exit(127);
    }
    logger_->debug("Launched browser: " + path + " (PID: " + std::to_string(pid_) + ")");

    auto deadline = std::chrono::steady_clock::now() + ready_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (endpoint_ready())
            return true;
        if (waitpid(pid_, nullptr, WNOHANG) == pid_) {
            logger_->error("Browser exited during startup");
            pid_ = -1;
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    logger_->error("Browser DevTools endpoint did not come up on port " + std::to_string(port));
    stop();
    return false;
}

bool BrowserLauncher::alive() {
    if (pid_ <= 0)
        return false;
    if (waitpid(pid_, nullptr, WNOHANG) == pid_) {
        logger_->warn("Browser exited (PID: " + std::to_string(pid_) + ")");
        pid_ = -1;
        return false;
    }
    return true;
}

void BrowserLauncher::stop() {
    if (pid_ > 0) {
        logger_->debug("Closing browser (PID: " + std::to_string(pid_) + ")");
        kill(pid_, SIGTERM);
        waitpid(pid_, nullptr, 0);
        pid_ = -1;
    }
    if (!user_data_dir_.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(user_data_dir_, ec);
        user_data_dir_.clear();
    }
}

}  // namespace Launcher
}  // namespace Browser
}  // namespace Folio
