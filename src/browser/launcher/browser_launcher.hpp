#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <sys/types.h>

#include "../../core/logger/logger.hpp"

namespace Folio {
namespace Browser {
namespace Launcher {

// Owns one browser process with a DevTools endpoint. Stopped on destruction.
class BrowserLauncher {
public:
    explicit BrowserLauncher(Core::LoggerPtr logger);
    ~BrowserLauncher();

    BrowserLauncher(const BrowserLauncher&)            = delete;
    BrowserLauncher& operator=(const BrowserLauncher&) = delete;

    static std::string find_browser();

    // Starts the browser and blocks until its DevTools endpoint answers or the timeout passes.
    bool launch(const std::string&        path,
                int                       port,
                bool                      headless,
                std::chrono::milliseconds ready_timeout = std::chrono::milliseconds(15000));
    void stop();

    bool running() const {
        return pid_ > 0;
    }
    // Reaps the process if it has exited.
    bool alive();
    int port() const {
        return port_;
    }

private:
    static std::vector<std::string> get_search_paths();
    bool                            endpoint_ready() const;

    Core::LoggerPtr       logger_;
    pid_t                 pid_  = -1;
    int                   port_ = 0;
    std::filesystem::path user_data_dir_;
};

}  // namespace Launcher
}  // namespace Browser
}  // namespace Folio
