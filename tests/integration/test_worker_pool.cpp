#include <csignal>
#include <filesystem>
#include <gtest/gtest.h>
#include <map>
#include <sstream>
#include "../../src/cluster/worker_pool.hpp"
#include "../../src/core/types/errors.hpp"

using namespace Folio::Cluster;
namespace fs = std::filesystem;

namespace {

class EventLog : public ExecutionObserver {
public:
    void on_task_event(const TaskEvent& event) override {
        counts[{event.page_id, event.kind}]++;
    }

    int count(const std::string& page_id, TaskEventKind kind) const {
        auto it = counts.find({page_id, kind});
        return it == counts.end() ? 0 : it->second;
    }

    std::map<std::pair<std::string, TaskEventKind>, int> counts;
};

// Sends SIGTERM to the process once the first task is handed to a worker.
class TerminateOnStart : public EventLog {
public:
    void on_task_event(const TaskEvent& event) override {
        EventLog::on_task_event(event);
        if (event.kind == TaskEventKind::Started && !raised) {
            raised = true;
            ::raise(SIGTERM);
        }
    }

    bool raised = false;
};

bool has_default_handler(int signal_number) {
    struct sigaction action {};
    ::sigaction(signal_number, nullptr, &action);
    return action.sa_handler == SIG_DFL;
}

}  // namespace

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (fs::exists("test_pool_out"))
            fs::remove_all("test_pool_out");
        root_   = fs::absolute("test_pool_out").lexically_normal();
        logger_ = std::make_shared<Folio::Core::Logger>(Folio::Core::LOG_VERBOSE, out_, err_);

        settings_.workers          = 2;
        settings_.max_retries      = 2;
        settings_.retry_base_delay = std::chrono::milliseconds(10);
        settings_.task_timeout     = std::chrono::milliseconds(10000);
        settings_.init_timeout     = std::chrono::milliseconds(10000);
        settings_.shutdown_grace   = std::chrono::milliseconds(2000);
        settings_.worker_command   = {FOLIO_FAKE_WORKER_PATH, "--quiet"};
        settings_.worker_settings.output_root = root_.string();
        settings_.worker_settings.cdp_port    = 9300;
    }

    void TearDown() override {
        if (fs::exists("test_pool_out"))
            fs::remove_all("test_pool_out");
    }

    void add_page(DownloadPlan& plan, const std::string& name) {
        DownloadTask task;
        task.page_id   = name;
        task.url       = "https://docs.example.com/" + name;
        task.title     = name;
        task.save_path = fs::path(name) / "index.html";
        plan.add(task);
    }

    DownloadPlan make_plan(const std::vector<std::string>& names) {
        DownloadPlan plan(root_);
        for (const auto& name : names)
            add_page(plan, name);
        plan.confirm();
        return plan;
    }

    fs::path               root_;
    std::ostringstream     out_, err_;
    Folio::Core::LoggerPtr logger_;
    PoolSettings           settings_;
    EventLog               events_;
};

TEST_F(WorkerPoolTest, SavesEveryPage) {
    DownloadPlan plan = make_plan({"alpha", "beta", "gamma", "delta", "epsilon"});

    WorkerPool      pool(settings_, logger_, &events_);
    ExecutionReport report = pool.run(plan);

    EXPECT_EQ(report.succeeded, 5u);
    EXPECT_EQ(report.failed, 0u);
    EXPECT_EQ(report.crashes, 0);
    for (const auto& task : plan.tasks()) {
        EXPECT_TRUE(fs::exists(task.save_path)) << task.save_path;
        EXPECT_TRUE(fs::exists(task.save_path.parent_path() / ".block-ids.json"));

        const TaskOutcome* outcome = report.find(task.page_id);
        ASSERT_NE(outcome, nullptr);
        EXPECT_TRUE(outcome->success);
        EXPECT_EQ(outcome->attempts, 1);
        EXPECT_EQ(outcome->block_ids, 1u);
        EXPECT_EQ(outcome->saved_path, task.save_path.string());
        EXPECT_EQ(events_.count(task.page_id, TaskEventKind::Completed), 1);
    }

    EXPECT_TRUE(has_default_handler(SIGINT));
    EXPECT_TRUE(has_default_handler(SIGTERM));
}

TEST_F(WorkerPoolTest, CrashedTaskIsRequeuedOnce) {
    settings_.workers = 1;
    DownloadPlan plan = make_plan({"crash-once", "steady"});

    WorkerPool      pool(settings_, logger_, &events_);
    ExecutionReport report = pool.run(plan);

    EXPECT_EQ(report.succeeded, 2u);
    EXPECT_EQ(report.crashes, 1);
    EXPECT_EQ(report.respawns, 1);

    const TaskOutcome* outcome = report.find("crash-once");
    ASSERT_NE(outcome, nullptr);
    EXPECT_TRUE(outcome->success);
    EXPECT_EQ(outcome->attempts, 2);
    EXPECT_EQ(events_.count("crash-once", TaskEventKind::TransientFailure), 1);
    EXPECT_EQ(events_.count("crash-once", TaskEventKind::Started), 2);
    EXPECT_EQ(report.find("steady")->attempts, 1);
}

TEST_F(WorkerPoolTest, PermanentFailureAfterMaxRetries) {
    settings_.max_retries = 1;
    DownloadPlan plan     = make_plan({"crash-always", "steady"});

    WorkerPool      pool(settings_, logger_, &events_);
    ExecutionReport report = pool.run(plan);

    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.failed, 1u);

    const TaskOutcome* outcome = report.find("crash-always");
    ASSERT_NE(outcome, nullptr);
    EXPECT_FALSE(outcome->success);
    EXPECT_EQ(outcome->attempts, 2);
    EXPECT_EQ(outcome->error, "worker crashed");
    EXPECT_EQ(events_.count("crash-always", TaskEventKind::PermanentFailure), 1);
    EXPECT_FALSE(fs::exists(root_ / "crash-always" / "index.html"));
}

TEST_F(WorkerPoolTest, HungWorkerIsKilledAtTheDeadline) {
    settings_.workers      = 1;
    settings_.max_retries  = 0;
    settings_.task_timeout = std::chrono::milliseconds(500);
    DownloadPlan plan      = make_plan({"hang", "steady"});

    auto            started = std::chrono::steady_clock::now();
    WorkerPool      pool(settings_, logger_, &events_);
    ExecutionReport report = pool.run(plan);

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(30));
    EXPECT_EQ(report.crashes, 1);
    EXPECT_FALSE(report.find("hang")->success);
    EXPECT_TRUE(report.find("steady")->success);
}

TEST_F(WorkerPoolTest, TerminationKillsWorkersAfterTheGracePeriod) {
    settings_.workers        = 1;
    settings_.task_timeout   = std::chrono::milliseconds(60000);
    settings_.shutdown_grace = std::chrono::milliseconds(300);
    DownloadPlan plan        = make_plan({"hang"});

    TerminateOnStart terminate;
    auto             started = std::chrono::steady_clock::now();
    WorkerPool       pool(settings_, logger_, &terminate);
    ExecutionReport  report = pool.run(plan);

    EXPECT_TRUE(terminate.raised);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(20));
    EXPECT_EQ(report.succeeded, 0u);
    EXPECT_EQ(report.failed, 1u);

    const TaskOutcome* outcome = report.find("hang");
    ASSERT_NE(outcome, nullptr);
    EXPECT_FALSE(outcome->success);
    EXPECT_EQ(outcome->attempts, 1);
    EXPECT_EQ(terminate.count("hang", TaskEventKind::PermanentFailure), 1);
    EXPECT_EQ(terminate.count("hang", TaskEventKind::TransientFailure), 0);
    EXPECT_NE(err_.str().find("Signal 15 received"), std::string::npos);
    EXPECT_NE(err_.str().find("ignored shutdown, terminating"), std::string::npos);

    EXPECT_TRUE(has_default_handler(SIGTERM));
}

TEST_F(WorkerPoolTest, RenderErrorsDoNotCostTheWorker) {
    settings_.workers     = 1;
    settings_.max_retries = 1;
    DownloadPlan plan     = make_plan({"render-error", "steady"});

    WorkerPool      pool(settings_, logger_, &events_);
    ExecutionReport report = pool.run(plan);

    EXPECT_EQ(report.crashes, 0);
    EXPECT_EQ(report.respawns, 0);
    EXPECT_EQ(report.succeeded, 1u);

    const TaskOutcome* outcome = report.find("render-error");
    ASSERT_NE(outcome, nullptr);
    EXPECT_EQ(outcome->attempts, 2);
    EXPECT_EQ(outcome->error, "render: scripted render failure");
}

TEST_F(WorkerPoolTest, LostBrowserSessionReplacesTheWorker) {
    settings_.workers = 1;
    DownloadPlan plan = make_plan({"session-dies", "steady"});

    WorkerPool      pool(settings_, logger_, &events_);
    ExecutionReport report = pool.run(plan);

    EXPECT_EQ(report.succeeded, 2u);
    EXPECT_EQ(report.failed, 0u);
    EXPECT_EQ(report.crashes, 1);
    EXPECT_EQ(report.respawns, 1);

    const TaskOutcome* outcome = report.find("session-dies");
    ASSERT_NE(outcome, nullptr);
    EXPECT_TRUE(outcome->success);
    EXPECT_EQ(outcome->attempts, 2);
    EXPECT_EQ(events_.count("session-dies", TaskEventKind::TransientFailure), 1);
    EXPECT_EQ(report.find("steady")->attempts, 1);
}

TEST_F(WorkerPoolTest, SessionFailureWithoutRespawnAbandonsThePlan) {
    settings_.workers                      = 1;
    settings_.respawn                      = false;
    settings_.worker_settings.browser_path = "fail-start";
    DownloadPlan plan                      = make_plan({"alpha", "beta"});

    WorkerPool      pool(settings_, logger_, &events_);
    ExecutionReport report = pool.run(plan);

    EXPECT_EQ(report.succeeded, 0u);
    EXPECT_EQ(report.failed, 2u);
    EXPECT_EQ(report.crashes, 1);
    EXPECT_NE(err_.str().find("no workers left"), std::string::npos);
}

TEST_F(WorkerPoolTest, UnconfirmedPlanIsRejected) {
    DownloadPlan plan(root_);
    add_page(plan, "alpha");

    WorkerPool pool(settings_, logger_);
    EXPECT_THROW(pool.run(plan), Folio::Core::ContractViolation);
    EXPECT_FALSE(fs::exists(root_ / "alpha" / "index.html"));
}

TEST_F(WorkerPoolTest, WorkerCommandIsRequired) {
    settings_.worker_command.clear();
    DownloadPlan plan = make_plan({"alpha"});

    WorkerPool pool(settings_, logger_);
    EXPECT_THROW(pool.run(plan), Folio::Core::ContractViolation);
}

TEST_F(WorkerPoolTest, EmptyPlanFinishesImmediately) {
    DownloadPlan plan(root_);
    plan.confirm();

    WorkerPool      pool(settings_, logger_);
    ExecutionReport report = pool.run(plan);
    EXPECT_TRUE(report.outcomes.empty());
}
