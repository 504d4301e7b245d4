/*
 * bctd — Daemon request handling tests
 * (c) 2025 bctd contributors
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "TestUtil.hpp"
#include "include/Daemon.hpp"

namespace bct {
namespace {

using test::FakeThresholdDevice;

Daemon* gStopTarget = nullptr;

void stopOnSignal(int) {
    if (gStopTarget) gStopTarget->requestStop();
}

class DaemonTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(tmp_.isValid());
        cfg_.pipePath = tmp_.file("battery_pipe");
        cfg_.pipeMode = 0600;
    }

    /* Builds the daemon around a fake battery holding (start, end). */
    std::unique_ptr<Daemon> makeDaemon(int start, int end) {
        auto dev = std::make_unique<FakeThresholdDevice>(start, end);
        fake_ = dev.get();
        return std::make_unique<Daemon>(cfg_, std::move(dev));
    }

    test::ScopedTempDir tmp_;
    DaemonConfig cfg_;
    FakeThresholdDevice* fake_{nullptr};
};

TEST_F(DaemonTest, AppliesRange) {
    auto d = makeDaemon(30, 80);
    EXPECT_EQ(LineOutcome::Applied, d->handleLine("10 to 90"));
    EXPECT_EQ(std::make_pair(10, 90), fake_->values());
}

TEST_F(DaemonTest, BadRequestsWriteNothingAndServingContinues) {
    auto d = makeDaemon(30, 80);
    EXPECT_EQ(LineOutcome::ParseError, d->handleLine("abc"));
    EXPECT_EQ(LineOutcome::ParseError, d->handleLine("150"));
    EXPECT_EQ(LineOutcome::Rejected, d->handleLine("10 to 5"));
    EXPECT_EQ(LineOutcome::Rejected, d->handleLine("start=101"));
    EXPECT_TRUE(fake_->writes().empty());
    EXPECT_EQ(std::make_pair(30, 80), fake_->values());

    EXPECT_EQ(LineOutcome::Applied, d->handleLine("40..60"));
    EXPECT_EQ(std::make_pair(40, 60), fake_->values());
}

TEST_F(DaemonTest, EmptyLineIsIgnored) {
    auto d = makeDaemon(30, 80);
    EXPECT_EQ(LineOutcome::Ignored, d->handleLine(""));
    EXPECT_TRUE(fake_->writes().empty());
}

TEST_F(DaemonTest, EmptyLineDoesNotTouchDevice) {
    auto d = makeDaemon(30, 80);
    fake_->failReads(true);
    EXPECT_EQ(LineOutcome::Ignored, d->handleLine("   "));
    EXPECT_EQ(0, fake_->reads());
}

TEST_F(DaemonTest, OneSidedRequestUsesConfiguredDefault) {
    cfg_.defaultStart = 20;
    cfg_.defaultEnd = 90;
    auto d = makeDaemon(30, 80);
    EXPECT_EQ(LineOutcome::Applied, d->handleLine("45"));
    EXPECT_EQ(std::make_pair(45, 90), fake_->values());

    EXPECT_EQ(LineOutcome::Applied, d->handleLine("end=70"));
    EXPECT_EQ(std::make_pair(20, 70), fake_->values());
}

TEST_F(DaemonTest, OneSidedRequestKeepsKernelValueWithoutDefault) {
    auto d = makeDaemon(30, 80);
    EXPECT_EQ(LineOutcome::Applied, d->handleLine("45"));
    EXPECT_EQ(std::make_pair(45, 80), fake_->values());

    EXPECT_EQ(LineOutcome::Applied, d->handleLine("..95"));
    EXPECT_EQ(std::make_pair(45, 95), fake_->values());
}

TEST_F(DaemonTest, FillValueCanMakeRequestInvalid) {
    cfg_.defaultEnd = 60;
    auto d = makeDaemon(30, 80);
    EXPECT_EQ(LineOutcome::Rejected, d->handleLine("start=70"));
    EXPECT_TRUE(fake_->writes().empty());
}

TEST_F(DaemonTest, DeviceFailureIsApplyError) {
    auto d = makeDaemon(30, 80);
    fake_->failWrites(ThresholdKind::End, -1);
    EXPECT_EQ(LineOutcome::ApplyError, d->handleLine("30..90"));
    EXPECT_EQ(std::make_pair(30, 80), fake_->values());

    fake_->failWrites(ThresholdKind::End, 0);
    EXPECT_EQ(LineOutcome::Applied, d->handleLine("30..90"));
}

TEST_F(DaemonTest, StartupDefaults) {
    cfg_.defaultStart = 40;
    cfg_.defaultEnd = 80;
    auto d = makeDaemon(0, 100);
    EXPECT_EQ(LineOutcome::Applied, d->applyStartupDefaults());
    EXPECT_EQ(std::make_pair(40, 80), fake_->values());
}

TEST_F(DaemonTest, StartupDefaultsSkippedWhenDisabledOrUnset) {
    cfg_.defaultStart = 40;
    cfg_.defaultEnd = 80;
    cfg_.applyDefaultsOnStart = false;
    auto d = makeDaemon(0, 100);
    EXPECT_EQ(LineOutcome::Ignored, d->applyStartupDefaults());
    EXPECT_TRUE(fake_->writes().empty());

    cfg_ = DaemonConfig{};
    cfg_.pipePath = tmp_.file("battery_pipe");
    auto d2 = makeDaemon(0, 100);
    EXPECT_EQ(LineOutcome::Ignored, d2->applyStartupDefaults());
    EXPECT_TRUE(fake_->writes().empty());
}

TEST_F(DaemonTest, InitFailsOnRegularFile) {
    test::writeFile(cfg_.pipePath, "");
    auto d = makeDaemon(30, 80);
    std::string err;
    EXPECT_FALSE(d->init(&err));
    EXPECT_FALSE(err.empty());
}

TEST_F(DaemonTest, RunLoopServesPipeUntilStopped) {
    auto d = makeDaemon(30, 80);
    std::string err;
    ASSERT_TRUE(d->init(&err)) << err;

    bool loopOk = false;
    std::atomic<bool> done{false};
    std::thread loop([&] {
        loopOk = d->runLoop();
        done = true;
    });

    auto send = [&](const std::string& data) {
        const int fd = ::open(cfg_.pipePath.c_str(), O_WRONLY);
        ASSERT_GE(fd, 0);
        ASSERT_EQ(static_cast<ssize_t>(data.size()), ::write(fd, data.data(), data.size()));
        ::close(fd);
    };

    send("garbage\n20..60\n");
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (fake_->values() != std::make_pair(20, 60) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(std::make_pair(20, 60), fake_->values());

    send("95\n");
    while (fake_->values() != std::make_pair(20, 95) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(std::make_pair(20, 95), fake_->values());

    // A writer that opens and closes wakes the pipe wait so the loop
    // sees the stop flag. Non-blocking, since the loop may already be gone.
    d->requestStop();
    while (!done) {
        const int fd = ::open(cfg_.pipePath.c_str(), O_WRONLY | O_NONBLOCK);
        if (fd >= 0) ::close(fd);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    loop.join();
    EXPECT_TRUE(loopOk);
    EXPECT_FALSE(d->pipe().isOpen());
}

TEST_F(DaemonTest, StopSignalBeforeWaitEndsLoop) {
    auto d = makeDaemon(30, 80);
    std::string err;
    ASSERT_TRUE(d->init(&err)) << err;

    struct sigaction sa{};
    struct sigaction oldSa{};
    sa.sa_handler = stopOnSignal;
    sigemptyset(&sa.sa_mask);
    ASSERT_EQ(0, ::sigaction(SIGUSR2, &sa, &oldSa));

    sigset_t usr2;
    sigset_t waitMask;
    sigemptyset(&usr2);
    sigaddset(&usr2, SIGUSR2);
    ASSERT_EQ(0, ::pthread_sigmask(SIG_BLOCK, &usr2, &waitMask));
    sigdelset(&waitMask, SIGUSR2);

    // The signal lands before runLoop() ever waits; no writer will come.
    gStopTarget = d.get();
    ASSERT_EQ(0, ::raise(SIGUSR2));
    EXPECT_FALSE(d->stopRequested());

    EXPECT_TRUE(d->runLoop(&waitMask));
    EXPECT_TRUE(d->stopRequested());
    EXPECT_TRUE(fake_->writes().empty());

    gStopTarget = nullptr;
    ::pthread_sigmask(SIG_UNBLOCK, &usr2, nullptr);
    ::sigaction(SIGUSR2, &oldSa, nullptr);
}

TEST(LineOutcomeTest, Names) {
    EXPECT_STREQ("applied", lineOutcomeName(LineOutcome::Applied));
    EXPECT_STREQ("rejected", lineOutcomeName(LineOutcome::Rejected));
    EXPECT_STREQ("parse error", lineOutcomeName(LineOutcome::ParseError));
}

} // namespace
} // namespace bct
