#include <filesystem>
#include <gtest/gtest.h>
#include <sstream>
#include "../../src/browser/launcher/browser_launcher.hpp"

using namespace Folio::Browser::Launcher;

class LauncherTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = std::make_shared<Folio::Core::Logger>(Folio::Core::LOG_ALL, out_, err_);
    }

    std::ostringstream     out_, err_;
    Folio::Core::LoggerPtr logger_;
};

TEST_F(LauncherTest, FindBrowser) {
    std::string path = BrowserLauncher::find_browser();
    if (!path.empty()) {
        EXPECT_TRUE(std::filesystem::exists(path));
#ifdef __APPLE__
        EXPECT_TRUE(path.find("Contents/MacOS") != std::string::npos || path.find("/bin/") != std::string::npos);
#endif
    }
}

TEST_F(LauncherTest, LaunchSmoke) {
    BrowserLauncher launcher(logger_);
    EXPECT_FALSE(launcher.launch("/non/existent/path", 9999, true));
    EXPECT_FALSE(launcher.running());
    EXPECT_NE(err_.str().find("does not exist"), std::string::npos);
}

TEST_F(LauncherTest, ProcessExitingDuringStartup) {
    std::string exe = std::filesystem::exists("/bin/true") ? "/bin/true" : "/usr/bin/true";
    if (!std::filesystem::exists(exe))
        GTEST_SKIP() << "no 'true' binary";

    BrowserLauncher launcher(logger_);
    EXPECT_FALSE(launcher.launch(exe, 1, true, std::chrono::milliseconds(5000)));
    EXPECT_FALSE(launcher.running());
    EXPECT_NE(err_.str().find("exited during startup"), std::string::npos);
}

TEST_F(LauncherTest, StopWithoutLaunchIsHarmless) {
    BrowserLauncher launcher(logger_);
    launcher.stop();
    EXPECT_FALSE(launcher.running());
    EXPECT_EQ(launcher.port(), 0);
    EXPECT_FALSE(launcher.alive());
}
