#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "../logger/logger.hpp"

namespace Folio {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["url"])
            config.root_url = yaml["url"].as<std::string>();
        if (yaml["depth"])
            config.depth = yaml["depth"].as<int>();
        if (yaml["max_depth"])
            config.depth = yaml["max_depth"].as<int>();
        if (yaml["workers"])
            config.workers = yaml["workers"].as<int>();
        if (yaml["output"])
            config.output_dir = yaml["output"].as<std::string>();
        if (yaml["output_dir"])
            config.output_dir = yaml["output_dir"].as<std::string>();
        if (yaml["browser_path"])
            config.browser_path = yaml["browser_path"].as<std::string>();
        if (yaml["headless"])
            config.headless = yaml["headless"].as<bool>();
        if (yaml["cdp_port"])
            config.cdp_port = yaml["cdp_port"].as<int>();
        if (yaml["max_retries"])
            config.max_retries = yaml["max_retries"].as<int>();
        if (yaml["retry_delay"])
            config.retry_delay_ms = yaml["retry_delay"].as<int>();
        if (yaml["task_timeout"])
            config.task_timeout_ms = yaml["task_timeout"].as<int>();
        if (yaml["page_timeout"])
            config.page_timeout_ms = yaml["page_timeout"].as<int>();
        if (yaml["settle"])
            config.settle_ms = yaml["settle"].as<int>();
        if (yaml["shutdown_grace"])
            config.shutdown_grace_ms = yaml["shutdown_grace"].as<int>();
        if (yaml["respawn"])
            config.respawn = yaml["respawn"].as<bool>();
        if (yaml["verbose"])
            config.verbose = yaml["verbose"].as<bool>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

int Config::log_level() const {
    if (quiet)
        return LOG_WARN | LOG_ERROR;
    if (verbose)
        return LOG_VERBOSE;
    return LOG_ALL;
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Folio - mirror a hierarchy of rendered pages into a static site"};

    app.add_option("url", config.root_url, "Root URL of the site to mirror");
    app.add_option("-d,--depth", config.depth, "Maximum discovery depth");
    app.add_option("-w,--workers", config.workers, "Number of worker processes");
    app.add_option("-o,--output", config.output_dir, "Output directory");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_option("--browser", config.browser_path, "Path to Chromium/Chrome executable");
    app.add_option("--cdp-port", config.cdp_port, "Chrome DevTools Protocol base port");
    app.add_option("--max-retries", config.max_retries, "Retries per page after a failure");
    app.add_option("--retry-delay", config.retry_delay_ms, "Base retry backoff (ms)");
    app.add_option("--task-timeout", config.task_timeout_ms, "Per-page worker deadline (ms)");
    app.add_option("--page-timeout", config.page_timeout_ms, "Page load timeout (ms)");
    app.add_option("--settle", config.settle_ms, "Wait after load before reading the page (ms)");
    app.add_option("--shutdown-grace", config.shutdown_grace_ms, "Grace period before kill (ms)");
    app.add_option("--from-graph", config.from_graph, "Skip discovery and load a saved graph");

    app.add_flag(
        "--no-headless",
        [&](size_t count) {
            if (count > 0)
                config.headless = false;
        },
        "Run browsers in windowed mode (debug only)");
    app.add_flag(
        "--no-respawn",
        [&](size_t count) {
            if (count > 0)
                config.respawn = false;
        },
        "Do not replace crashed workers");
    app.add_flag("-y,--yes", config.assume_yes, "Skip the confirmation prompt");
    app.add_flag("--discover-only", config.discover_only, "Stop after discovery");
    app.add_flag("-v,--verbose", config.verbose, "Debug output");
    app.add_flag("-q,--quiet", config.quiet, "Only warnings and errors");

    app.add_flag("--worker", config.worker)->group("");
    app.add_option("--worker-id", config.worker_id)->group("");
    app.add_option("--ipc-in", config.ipc_in)->group("");
    app.add_option("--ipc-out", config.ipc_out)->group("");

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
}  // namespace Folio
