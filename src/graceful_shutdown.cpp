#include "graceful_shutdown.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstring>

namespace GracefulShutdown {

static SignalState g_signalState;

SignalState& getGlobalSignalState() {
    return g_signalState;
}

void signalHandler(int sig) {
    g_signalState.received = sig;
    if (sig == SIGHUP) {
        g_signalState.reload = 1;
    } else {
        g_signalState.shutdown = 1;
    }
}

bool installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    for (int sig : {SIGTERM, SIGINT, SIGHUP}) {
        if (sigaction(sig, &action, nullptr) != 0) {
            LOG_ERROR("sigaction({}) failed: {}", sig, std::strerror(errno));
            return false;
        }
    }

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (sigaction(SIGPIPE, &ignore, nullptr) != 0) {
        LOG_WARN("Cannot ignore SIGPIPE: {}", std::strerror(errno));
    }
    return true;
}

bool Controller::processPendingSignals() {
    if (!signalState_) {
        return false;
    }

    lastAction_ = Action::NONE;

    if (signalState_->shutdown) {
        signalState_->shutdown = 0;
        signalState_->reload = 0;  // Shutdown wins over a pending reload
        lastSignal_ = signalState_->received;
        lastAction_ = Action::SHUTDOWN;

        LOG_INFO("Received signal {}, shutting down", lastSignal_);
        running_ = false;
        if (shutdownCallback_) {
            shutdownCallback_();
        }
        return true;
    }

    if (signalState_->reload) {
        signalState_->reload = 0;
        lastSignal_ = signalState_->received;
        lastAction_ = Action::RELOAD;
        ++reloadCount_;

        LOG_INFO("Received SIGHUP (signal {}), reloading configuration", lastSignal_);
        if (reloadCallback_) {
            reloadCallback_();
        }
        return true;
    }

    return false;
}

}  // namespace GracefulShutdown
