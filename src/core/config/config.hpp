#pragma once
#include <string>

#include "../types/constants.hpp"

namespace Folio {
namespace Core {

struct Config {
    std::string root_url;
    int         depth      = Constants::DEFAULT_DEPTH;
    int         workers    = Constants::DEFAULT_WORKERS;
    std::string output_dir = Constants::DEFAULT_OUTPUT_DIR;
    std::string config_path;

    std::string browser_path;
    bool        headless = true;
    int         cdp_port = Constants::DEFAULT_CDP_PORT;

    int  max_retries       = Constants::DEFAULT_MAX_RETRIES;
    int  retry_delay_ms    = Constants::DEFAULT_RETRY_DELAY_MS;
    int  task_timeout_ms   = Constants::DEFAULT_TASK_TIMEOUT_MS;
    int  page_timeout_ms   = Constants::DEFAULT_PAGE_TIMEOUT_MS;
    int  settle_ms         = Constants::DEFAULT_SETTLE_MS;
    int  shutdown_grace_ms = Constants::DEFAULT_SHUTDOWN_GRACE_MS;
    bool respawn           = true;

    bool        assume_yes    = false;
    bool        discover_only = false;
    std::string from_graph;
    bool        verbose = false;
    bool        quiet   = false;

    // Worker process mode
    bool worker    = false;
    int  worker_id = 0;
    int  ipc_in    = -1;
    int  ipc_out   = -1;

    int log_level() const;

    static Config parse(int argc, char* argv[]);
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Folio
