#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"

class ShutdownManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
        ShutdownManager::getInstance().reset();
    }

    void TearDown() override
    {
        ShutdownManager::getInstance().reset();
    }
};

TEST_F(ShutdownManagerTest, ProgrammaticShutdownUnblocksWait)
{
    auto &mgr = ShutdownManager::getInstance();

    std::atomic<bool> unblocked{false};
    std::thread waiter([&]()
                       {
        mgr.waitForShutdown();
        unblocked.store(true); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(unblocked.load());
    mgr.requestShutdown("card removed by user");

    waiter.join();
    EXPECT_TRUE(unblocked.load());
    EXPECT_TRUE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), 0);
    EXPECT_EQ(mgr.getReason(), "card removed by user");
}

TEST_F(ShutdownManagerTest, SignalNumberIsRecorded)
{
    auto &mgr = ShutdownManager::getInstance();
    EXPECT_FALSE(mgr.isShutdownRequested());

    mgr.requestShutdown("SIGTERM", SIGTERM);

    EXPECT_TRUE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), SIGTERM);
    EXPECT_EQ(mgr.getReason(), "SIGTERM");
}

TEST_F(ShutdownManagerTest, TimedWaitReportsWhetherShutdownHappened)
{
    auto &mgr = ShutdownManager::getInstance();
    EXPECT_FALSE(mgr.waitForShutdownFor(std::chrono::milliseconds(20)));
    mgr.requestShutdown("done");
    EXPECT_TRUE(mgr.waitForShutdownFor(std::chrono::milliseconds(20)));
}

TEST_F(ShutdownManagerTest, CallbacksRunOnceWithReason)
{
    auto &mgr = ShutdownManager::getInstance();
    std::vector<std::string> reasons;
    mgr.onShutdown([&reasons](const std::string &reason)
                   { reasons.push_back(reason); });
    mgr.onShutdown([](const std::string &)
                   { throw std::runtime_error("callback failure is logged, not propagated"); });

    mgr.requestShutdown("SIGINT", SIGINT);
    mgr.requestShutdown("second request");

    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons[0], "SIGINT");
}

TEST_F(ShutdownManagerTest, LateCallbackRunsImmediately)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("already stopping");

    bool called = false;
    mgr.onShutdown([&called](const std::string &reason)
                   {
        called = true;
        EXPECT_EQ(reason, "already stopping"); });
    EXPECT_TRUE(called);
}

TEST_F(ShutdownManagerTest, ClearedCallbacksAreNotInvoked)
{
    auto &mgr = ShutdownManager::getInstance();
    bool called = false;
    mgr.onShutdown([&called](const std::string &)
                   { called = true; });
    mgr.clearCallbacks();
    mgr.requestShutdown("after session");
    EXPECT_FALSE(called);
}
