#include "mirror.hpp"
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include "../browser/cdp_prober.hpp"
#include "../cluster/download_plan.hpp"
#include "../cluster/worker_pool.hpp"
#include "../discovery/discoverer.hpp"
#include "../graph/tree_printer.hpp"
#include "../path/filesystem_resolver.hpp"
#include "../path/resolver_factory.hpp"
#include "../rewrite/integrity_auditor.hpp"
#include "../rewrite/link_rewriter.hpp"
#include "../storage/disk_storage.hpp"
#include "../utils/text/string_utils.hpp"

namespace Folio {
namespace Engine {

namespace fs  = std::filesystem;
namespace net = boost::asio;

namespace {

// Pages that needed more than one attempt.
class RetryTally : public Cluster::ExecutionObserver {
public:
    void on_task_event(const Cluster::TaskEvent& event) override {
        if (event.kind == Cluster::TaskEventKind::TransientFailure)
            retried_.insert(event.page_id);
    }

    size_t retried() const {
        return retried_.size();
    }

private:
    std::set<std::string> retried_;
};

}  // namespace

Mirror::Mirror(Core::Config config, Core::LoggerPtr logger, std::istream& input)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      input_(input),
      output_root_(fs::absolute(config_.output_dir).lexically_normal()) {
}

Graph::PageGraph Mirror::discover() {
    if (!config_.from_graph.empty()) {
        logger_->info("Loading page graph from " + config_.from_graph);
        return Graph::PageGraph::load(config_.from_graph);
    }

    Browser::SessionOptions options;
    options.browser_path = config_.browser_path;
    options.port         = config_.cdp_port;
    options.headless     = config_.headless;
    options.page_timeout = std::chrono::milliseconds(config_.page_timeout_ms);
    options.settle       = std::chrono::milliseconds(config_.settle_ms);

    net::io_context       ioc;
    Browser::CdpProber    prober(ioc, options, logger_);
    Discovery::Discoverer discoverer(prober, logger_);

    std::optional<Discovery::DiscoveryResult> result;
    std::exception_ptr                        failure;

    net::co_spawn(
        ioc,
        [&]() -> net::awaitable<void> {
            co_await prober.open();
            result   = co_await discoverer.discover(config_.root_url, config_.depth);
            cookies_ = co_await prober.session_cookies();
            co_await prober.close();
        },
        [&](std::exception_ptr e) { failure = e; });
    ioc.run();

    if (failure)
        std::rethrow_exception(failure);

    logger_->info("Discovery: " + std::to_string(result->stats.probed) + " probed, "
                  + std::to_string(result->stats.failed) + " failed, "
                  + std::to_string(cookies_.size()) + " session cookies");
    return std::move(result->graph);
}

bool Mirror::confirm(const std::string& question) {
    if (config_.assume_yes)
        return true;

    logger_->plain(question + " [y/N] ");
    std::string answer;
    if (!std::getline(input_, answer))
        return false;
    answer = Utils::Text::to_lower(Utils::Text::trim(answer));
    return answer == "y" || answer == "yes";
}

std::vector<std::string> Mirror::worker_command() const {
    std::error_code ec;
    fs::path        self = fs::read_symlink("/proc/self/exe", ec);
    if (ec)
        throw std::runtime_error("cannot locate own executable: " + ec.message());

    std::vector<std::string> command = {self.string(), "--worker"};
    if (config_.verbose)
        command.push_back("--verbose");
    if (config_.quiet)
        command.push_back("--quiet");
    return command;
}

Blocks::BlockMapCache Mirror::load_block_maps(const Graph::PageGraph&         graph,
                                              const Cluster::ExecutionReport& report) const {
    Blocks::BlockIdMapper mapper(logger_);
    Blocks::BlockMapCache cache;

    for (const auto& outcome : report.outcomes) {
        if (!outcome.success)
            continue;
        auto handle = graph.find(outcome.page_id);
        if (!handle)
            continue;
        fs::path page_dir = (output_root_ / Path::FilesystemResolver::document_path(graph.node(*handle)))
                                .parent_path();
        Blocks::BlockMap map = mapper.load(page_dir);
        if (!map.empty())
            cache.emplace(outcome.page_id, std::move(map));
    }
    return cache;
}

int Mirror::run() {
    if (config_.root_url.empty() && config_.from_graph.empty()) {
        logger_->error("No root URL given.");
        return MIRROR_ERROR;
    }

    Graph::PageGraph graph = discover();
    if (graph.empty()) {
        logger_->error("Discovery produced no pages.");
        return MIRROR_ERROR;
    }

    if (config_.from_graph.empty()) {
        fs::path graph_file = output_root_ / Core::Constants::GRAPH_FILENAME;
        graph.save(graph_file);
        logger_->info("Page graph written to " + graph_file.string());
    }

    Graph::GraphStatistics stats = graph.statistics();
    Graph::TreePrinter::print(graph, *logger_);
    logger_->info(std::to_string(stats.nodes) + " pages, depth " + std::to_string(stats.max_depth) + ", "
                  + std::to_string(stats.forward_edges) + " forward / " + std::to_string(stats.back_edges)
                  + " back / " + std::to_string(stats.cross_edges) + " cross links");

    if (config_.discover_only)
        return MIRROR_OK;

    Path::ResolverFactory factory(logger_);
    Cluster::DownloadPlan plan = Cluster::DownloadPlan::build(graph, output_root_, factory);

    if (!confirm("Download " + std::to_string(plan.tasks().size()) + " pages into "
                 + output_root_.string() + "?")) {
        logger_->warn("Aborted by user.");
        return MIRROR_OK;
    }
    plan.confirm();

    Cluster::PoolSettings settings;
    settings.workers          = config_.workers;
    settings.max_retries      = config_.max_retries;
    settings.retry_base_delay = std::chrono::milliseconds(config_.retry_delay_ms);
    settings.task_timeout     = std::chrono::milliseconds(config_.task_timeout_ms);
    settings.shutdown_grace   = std::chrono::milliseconds(config_.shutdown_grace_ms);
    settings.respawn          = config_.respawn;
    settings.worker_command   = worker_command();
    settings.cookies          = cookies_;

    settings.worker_settings.output_root     = output_root_.string();
    settings.worker_settings.browser_path    = config_.browser_path;
    settings.worker_settings.cdp_port        = config_.cdp_port;
    settings.worker_settings.headless        = config_.headless;
    settings.worker_settings.page_timeout_ms = config_.page_timeout_ms;
    settings.worker_settings.settle_ms       = config_.settle_ms;

    RetryTally               retries;
    Cluster::WorkerPool      pool(settings, logger_, &retries);
    Cluster::ExecutionReport report = pool.run(plan);

    std::set<std::string> saved;
    for (const auto& outcome : report.outcomes) {
        if (outcome.success)
            saved.insert(outcome.page_id);
    }

    Blocks::BlockMapCache block_maps = load_block_maps(graph, report);
    Storage::DiskStorage  storage(output_root_, logger_);

    Rewrite::LinkRewriter rewriter(graph, factory, block_maps, saved, logger_);
    Rewrite::RewriteStats rewrite = rewriter.rewrite_all(storage);

    Rewrite::IntegrityAuditor auditor(graph, saved, logger_);
    Rewrite::AuditReport      audit = auditor.audit(storage);

    logger_->info("Links: " + std::to_string(rewrite.rewritten) + " rewritten of "
                  + std::to_string(rewrite.links) + " (" + std::to_string(rewrite.anchors) + " anchors, "
                  + std::to_string(rewrite.external) + " external)");
    if (!audit.clean()) {
        logger_->warn("Audit: " + std::to_string(audit.missing.size()) + " missing documents, "
                      + std::to_string(audit.residual_links) + " live-site links left");
    }

    std::string summary = std::to_string(report.succeeded) + "/" + std::to_string(plan.tasks().size())
                          + " pages mirrored into " + output_root_.string();
    if (report.crashes > 0 || retries.retried() > 0) {
        summary += " (" + std::to_string(report.crashes) + " worker crashes, "
                   + std::to_string(retries.retried()) + " pages retried)";
    }

    if (report.failed > 0) {
        logger_->warn(summary + ", " + std::to_string(report.failed) + " failed");
        return MIRROR_INCOMPLETE;
    }
    logger_->success(summary);
    return MIRROR_OK;
}

}  // namespace Engine
}  // namespace Folio
