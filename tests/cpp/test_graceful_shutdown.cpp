#include "graceful_shutdown.h"

#include <gtest/gtest.h>

using namespace GracefulShutdown;

class GracefulShutdownTest : public ::testing::Test {
   protected:
    void SetUp() override {
        state_.reset();
        controller_.setSignalState(&state_);
        shutdownCalled_ = 0;
        reloadCalled_ = 0;
        controller_.setShutdownCallback([this]() { ++shutdownCalled_; });
        controller_.setReloadCallback([this]() { ++reloadCalled_; });
    }

    SignalState state_;
    Controller controller_;
    int shutdownCalled_ = 0;
    int reloadCalled_ = 0;
};

// ========== Signal State Tests ==========

TEST_F(GracefulShutdownTest, SignalState_InitiallyZero) {
    SignalState s;
    EXPECT_EQ(s.shutdown, 0);
    EXPECT_EQ(s.reload, 0);
    EXPECT_EQ(s.received, 0);
}

TEST_F(GracefulShutdownTest, SignalState_Reset) {
    state_.shutdown = 1;
    state_.reload = 1;
    state_.received = 15;
    state_.reset();
    EXPECT_EQ(state_.shutdown, 0);
    EXPECT_EQ(state_.reload, 0);
    EXPECT_EQ(state_.received, 0);
}

// ========== Controller Tests ==========

TEST_F(GracefulShutdownTest, Controller_InitialState) {
    EXPECT_TRUE(controller_.isRunning());
    EXPECT_EQ(controller_.getLastAction(), Controller::Action::NONE);
    EXPECT_EQ(controller_.reloadCount(), 0);
}

TEST_F(GracefulShutdownTest, NoSignalState_ReturnsFalse) {
    Controller detached;
    EXPECT_FALSE(detached.processPendingSignals());
    EXPECT_TRUE(detached.isRunning());
}

TEST_F(GracefulShutdownTest, NoPendingSignal_ReturnsFalse) {
    EXPECT_FALSE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.getLastAction(), Controller::Action::NONE);
    EXPECT_EQ(shutdownCalled_, 0);
    EXPECT_EQ(reloadCalled_, 0);
}

TEST_F(GracefulShutdownTest, Sigterm_StopsRunning) {
    state_.shutdown = 1;
    state_.received = SIGTERM;

    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.getLastAction(), Controller::Action::SHUTDOWN);
    EXPECT_EQ(controller_.getLastSignal(), SIGTERM);
    EXPECT_FALSE(controller_.isRunning());
    EXPECT_EQ(shutdownCalled_, 1);
    EXPECT_EQ(state_.shutdown, 0);
}

TEST_F(GracefulShutdownTest, Sighup_ReloadsAndKeepsRunning) {
    state_.reload = 1;
    state_.received = SIGHUP;

    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.getLastAction(), Controller::Action::RELOAD);
    EXPECT_TRUE(controller_.isRunning());
    EXPECT_EQ(reloadCalled_, 1);
    EXPECT_EQ(controller_.reloadCount(), 1);
    EXPECT_EQ(state_.reload, 0);
}

TEST_F(GracefulShutdownTest, ShutdownWinsOverPendingReload) {
    state_.reload = 1;
    state_.shutdown = 1;
    state_.received = SIGINT;

    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.getLastAction(), Controller::Action::SHUTDOWN);
    EXPECT_EQ(shutdownCalled_, 1);
    EXPECT_EQ(reloadCalled_, 0);
    EXPECT_EQ(state_.reload, 0);

    // The discarded reload does not come back
    EXPECT_FALSE(controller_.processPendingSignals());
}

TEST_F(GracefulShutdownTest, RepeatedReloadsAreCounted) {
    for (int i = 0; i < 3; ++i) {
        state_.reload = 1;
        state_.received = SIGHUP;
        controller_.processPendingSignals();
    }
    EXPECT_EQ(controller_.reloadCount(), 3);
    EXPECT_EQ(reloadCalled_, 3);
}

TEST_F(GracefulShutdownTest, SignalHandlerSetsGlobalFlags) {
    auto& global = getGlobalSignalState();
    global.reset();

    signalHandler(SIGHUP);
    EXPECT_EQ(global.reload, 1);
    EXPECT_EQ(global.shutdown, 0);
    EXPECT_EQ(global.received, SIGHUP);

    signalHandler(SIGTERM);
    EXPECT_EQ(global.shutdown, 1);
    EXPECT_EQ(global.received, SIGTERM);

    global.reset();
}
