#pragma once

#include "core/daemon_constants.h"
#include "core/error_codes.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

namespace zmq {
class context_t;
class socket_t;
}  // namespace zmq

namespace daemon_ipc {

/**
 * @brief One decoded request
 *
 * Accepts either JSON ({"cmd": "...", "params": {...}}) or the raw text form
 * "COMMAND" / "COMMAND:payload".
 */
struct ZmqRequest {
    std::string raw;
    std::optional<nlohmann::json> json;
    std::string command;
    std::string payload;
    bool isJson = false;
    std::string parseError;

    // "params" object of a JSON request, empty object otherwise
    nlohmann::json params() const;
};

/**
 * @brief REP command socket plus PUB event socket, served from one thread
 */
class ZmqCommandServer {
   public:
    using Handler = std::function<std::string(const ZmqRequest&)>;

    explicit ZmqCommandServer(std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH,
                              int recvTimeoutMs = 500);
    ~ZmqCommandServer();

    ZmqCommandServer(const ZmqCommandServer&) = delete;
    ZmqCommandServer& operator=(const ZmqCommandServer&) = delete;

    // Register before start(); handlers run on the server thread.
    void registerCommand(const std::string& command, Handler handler);

    bool start();
    void stop();
    bool isRunning() const {
        return running_.load();
    }
    bool hasBindError() const {
        return bindFailed_.load();
    }

    // Thread-safe, non-blocking.
    bool publish(const std::string& message);

    const std::string& endpoint() const {
        return endpoint_;
    }
    const std::string& pubEndpoint() const {
        return pubEndpoint_;
    }

    static std::string buildOkResponse(const ZmqRequest& request, const nlohmann::json& data,
                                       const std::string& text = "OK");
    static std::string buildErrorResponse(const ZmqRequest& request,
                                          ScrobbleEngine::ErrorCode code,
                                          const std::string& message);
    static std::string derivePubEndpoint(const std::string& endpoint);

   private:
    ZmqRequest buildRequest(const std::string& raw) const;
    std::string dispatchRequest(const ZmqRequest& request);
    void serverLoop();
    void cleanupSockets();
    void cleanupIpcPath(const std::string& endpoint) const;

    std::string endpoint_;
    std::string pubEndpoint_;
    int recvTimeoutMs_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> repSocket_;
    std::unique_ptr<zmq::socket_t> pubSocket_;
    std::thread serverThread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> bindFailed_{false};
    std::map<std::string, Handler> handlers_;
    mutable std::mutex pubMutex_;
};

}  // namespace daemon_ipc
