#pragma once

#include <atomic>
#include <csignal>
#include <functional>

namespace GracefulShutdown {

// ========== Signal State ==========
// Flags set by the signal handler and polled by the poll loop.

struct SignalState {
    volatile sig_atomic_t shutdown = 0;  // SIGTERM, SIGINT
    volatile sig_atomic_t reload = 0;    // SIGHUP
    volatile sig_atomic_t received = 0;  // Last signal number (for logging)

    void reset() {
        shutdown = 0;
        reload = 0;
        received = 0;
    }
};

// ========== Controller ==========
// Turns pending signal flags into actions. Testable without real signals.
//
// Shutdown (SIGTERM/SIGINT) takes priority over reload (SIGHUP): a reload
// pending at the same time is discarded. A reload keeps the daemon running.

class Controller {
   public:
    using ShutdownCallback = std::function<void()>;
    using ReloadCallback = std::function<void()>;

    enum class Action { NONE, SHUTDOWN, RELOAD };

    Controller() = default;

    void setSignalState(SignalState* state) {
        signalState_ = state;
    }
    void setShutdownCallback(ShutdownCallback cb) {
        shutdownCallback_ = std::move(cb);
    }
    void setReloadCallback(ReloadCallback cb) {
        reloadCallback_ = std::move(cb);
    }

    // Returns true if a signal was handled.
    bool processPendingSignals();

    bool isRunning() const {
        return running_.load();
    }
    void setRunning(bool running) {
        running_ = running;
    }

    int getLastSignal() const {
        return lastSignal_;
    }
    Action getLastAction() const {
        return lastAction_;
    }
    int reloadCount() const {
        return reloadCount_;
    }

   private:
    SignalState* signalState_ = nullptr;
    std::atomic<bool> running_{true};

    ShutdownCallback shutdownCallback_;
    ReloadCallback reloadCallback_;

    int lastSignal_ = 0;
    int reloadCount_ = 0;
    Action lastAction_ = Action::NONE;
};

// Async-signal-safe handler that only sets flags in the global state.
void signalHandler(int sig);

SignalState& getGlobalSignalState();

// Install signalHandler for SIGTERM, SIGINT and SIGHUP; ignore SIGPIPE.
bool installSignalHandlers();

}  // namespace GracefulShutdown
