#include "hitl/runtime/ShutdownCoordinator.hpp"
#include "hitl/util/Logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hitl::rt;

TEST(ShutdownCoordinatorTest, StepsRunInOrderOnce) {
    ShutdownCoordinator sc;
    std::vector<std::string> ran;
    sc.registerStep("late", 90, [&ran] { ran.push_back("late"); });
    sc.registerStep("early", 5, [&ran] { ran.push_back("early"); });
    sc.registerStep("mid", 40, [&ran] { ran.push_back("mid"); });
    sc.stop();
    sc.stop();
    EXPECT_EQ(ran, (std::vector<std::string>{"early", "mid", "late"}));
    EXPECT_TRUE(sc.stopping());
}

TEST(ShutdownCoordinatorTest, FailingStepDoesNotBlockLaterSteps) {
    ShutdownCoordinator sc;
    bool after = false;
    sc.registerStep("bad", 1, [] { throw std::runtime_error("nope"); });
    sc.registerStep("after", 2, [&after] { after = true; });
    EXPECT_NO_THROW(sc.stop());
    EXPECT_TRUE(after);
}

TEST(ShutdownCoordinatorTest, FailingStepIsLoggedWithItsName) {
    using namespace hitl::util;
    const std::string path = ::testing::TempDir() + "hitl_shutdown_fail.log";
    std::remove(path.c_str());
    const LogLevel prev = logger().level();
    logger().setLevel(LogLevel::Info);
    ASSERT_TRUE(logger().setFile(path));

    ShutdownCoordinator sc;
    sc.registerStep("http-close", 40, [] { throw std::runtime_error("socket gone"); });
    sc.stop();

    logger().setFile("");
    logger().setLevel(prev);
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    std::remove(path.c_str());

    const std::string out = ss.str();
    EXPECT_NE(out.find("shutdown.step_failed"), std::string::npos);
    EXPECT_NE(out.find("step=http-close"), std::string::npos);
    EXPECT_NE(out.find("error=socket gone"), std::string::npos);
}
