#include <filesystem>
#include <gtest/gtest.h>
#include <sstream>
#include "../../src/engine/mirror.hpp"

using namespace Folio::Engine;
using Folio::Core::Config;
namespace fs = std::filesystem;

namespace {

std::string page(const std::string& name, char id) {
    return "https://docs.example.com/" + name + "-" + std::string(32, id);
}

}  // namespace

class MirrorRunTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (fs::exists("test_mirror_out"))
            fs::remove_all("test_mirror_out");
        logger_ = std::make_shared<Folio::Core::Logger>(Folio::Core::LOG_ALL, out_, err_);

        Folio::Graph::PageGraph graph;
        auto                    root  = graph.add_root(page("Home", '0'), "Home");
        auto                    guide = graph.add_child(root, page("Guide", '1'), "Guide");
        graph.add_child(guide, page("Setup", '2'), "Setup");
        graph.freeze();
        graph.save("test_mirror_out/graph.json");

        config_.from_graph = "test_mirror_out/graph.json";
        config_.output_dir = "test_mirror_out/site";
    }

    void TearDown() override {
        if (fs::exists("test_mirror_out"))
            fs::remove_all("test_mirror_out");
    }

    std::ostringstream     out_, err_;
    Folio::Core::LoggerPtr logger_;
    Config                 config_;
};

TEST(MirrorTest, ConfirmPrompt) {
    std::ostringstream out, err;
    auto               logger = std::make_shared<Folio::Core::Logger>(Folio::Core::LOG_ALL, out, err);

    std::istringstream answers("y\n  YES \nno\n\n");
    Mirror             mirror(Config{}, logger, answers);
    EXPECT_TRUE(mirror.confirm("Go?"));
    EXPECT_TRUE(mirror.confirm("Go?"));
    EXPECT_FALSE(mirror.confirm("Go?"));
    EXPECT_FALSE(mirror.confirm("Go?"));
    EXPECT_FALSE(mirror.confirm("Go?"));  // end of input
    EXPECT_NE(out.str().find("Go? [y/N]"), std::string::npos);

    Config yes;
    yes.assume_yes = true;
    std::istringstream none;
    Mirror             unattended(yes, logger, none);
    EXPECT_TRUE(unattended.confirm("Go?"));
}

TEST(MirrorTest, WorkerCommand) {
    Config config;
    config.verbose = true;
    Mirror mirror(config, std::make_shared<Folio::Core::Logger>(0));

    auto command = mirror.worker_command();
    ASSERT_GE(command.size(), 3u);
    EXPECT_TRUE(fs::path(command[0]).is_absolute());
    EXPECT_EQ(command[1], "--worker");
    EXPECT_EQ(command[2], "--verbose");
}

TEST_F(MirrorRunTest, NeedsRootUrl) {
    Config empty;
    Mirror mirror(empty, logger_);
    EXPECT_EQ(mirror.run(), MIRROR_ERROR);
    EXPECT_NE(err_.str().find("No root URL"), std::string::npos);
}

TEST_F(MirrorRunTest, DiscoverOnlyPrintsTheTree) {
    config_.discover_only = true;
    Mirror mirror(config_, logger_);
    EXPECT_EQ(mirror.run(), MIRROR_OK);

    std::string printed = out_.str();
    EXPECT_NE(printed.find("└─ Home"), std::string::npos);
    EXPECT_NE(printed.find("   └─ Guide"), std::string::npos);
    EXPECT_NE(printed.find("      └─ Setup"), std::string::npos);
    EXPECT_NE(printed.find("3 pages, depth 2"), std::string::npos);
    EXPECT_FALSE(fs::exists("test_mirror_out/site/index.html"));
}

TEST_F(MirrorRunTest, DeclinedConfirmationDownloadsNothing) {
    std::istringstream answer("n\n");
    Mirror             mirror(config_, logger_, answer);
    EXPECT_EQ(mirror.run(), MIRROR_OK);
    EXPECT_NE(err_.str().find("Aborted by user."), std::string::npos);
    EXPECT_FALSE(fs::exists("test_mirror_out/site/index.html"));
}
