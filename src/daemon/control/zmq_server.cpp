#include "daemon/control/zmq_server.h"

#include "logging/logger.h"

#include <cctype>
#include <cstdio>
#include <zmq.hpp>

namespace daemon_ipc {
namespace {

using ScrobbleEngine::ErrorCode;

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string toUpper(std::string value) {
    for (auto& c : value) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return value;
}

}  // namespace

nlohmann::json ZmqRequest::params() const {
    if (json && json->contains("params") && (*json)["params"].is_object()) {
        return (*json)["params"];
    }
    return nlohmann::json::object();
}

ZmqCommandServer::ZmqCommandServer(std::string endpoint, int recvTimeoutMs)
    : endpoint_(std::move(endpoint)),
      pubEndpoint_(derivePubEndpoint(endpoint_)),
      recvTimeoutMs_(recvTimeoutMs) {}

ZmqCommandServer::~ZmqCommandServer() {
    stop();
}

void ZmqCommandServer::registerCommand(const std::string& command, Handler handler) {
    handlers_[toUpper(command)] = std::move(handler);
}

bool ZmqCommandServer::start() {
    if (running_.load()) {
        return true;
    }

    try {
        context_ = std::make_unique<zmq::context_t>(1);
        repSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
        repSocket_->set(zmq::sockopt::rcvtimeo, recvTimeoutMs_);
        repSocket_->set(zmq::sockopt::linger, 0);

        cleanupIpcPath(endpoint_);
        repSocket_->bind(endpoint_);

        pubSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
        pubSocket_->set(zmq::sockopt::linger, 0);
        cleanupIpcPath(pubEndpoint_);
        pubSocket_->bind(pubEndpoint_);
    } catch (const zmq::error_t& e) {
        LOG_ERROR("ZeroMQ: bind failed on {}: {}", endpoint_, e.what());
        bindFailed_.store(true);
        cleanupSockets();
        return false;
    }

    running_.store(true);
    bindFailed_.store(false);
    serverThread_ = std::thread(&ZmqCommandServer::serverLoop, this);

    LOG_INFO("ZeroMQ: listening on {} (events on {})", endpoint_, pubEndpoint_);
    return true;
}

void ZmqCommandServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // The loop notices running_ within one receive timeout
    if (serverThread_.joinable()) {
        serverThread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(pubMutex_);
        cleanupSockets();
    }
    cleanupIpcPath(endpoint_);
    cleanupIpcPath(pubEndpoint_);
    LOG_INFO("ZeroMQ: stopped");
}

bool ZmqCommandServer::publish(const std::string& message) {
    std::lock_guard<std::mutex> lock(pubMutex_);
    if (!pubSocket_) {
        return false;
    }

    try {
        pubSocket_->send(zmq::buffer(message), zmq::send_flags::dontwait);
        return true;
    } catch (const zmq::error_t& e) {
        LOG_WARN("ZeroMQ: PUB send failed: {}", e.what());
        return false;
    }
}

ZmqRequest ZmqCommandServer::buildRequest(const std::string& raw) const {
    ZmqRequest request;
    request.raw = raw;

    if (raw.empty()) {
        return request;
    }

    if (raw.front() == '{') {
        request.isJson = true;
        try {
            request.json = nlohmann::json::parse(raw);
            if (request.json->contains("cmd") && (*request.json)["cmd"].is_string()) {
                request.command = toUpper((*request.json)["cmd"].get<std::string>());
            }
        } catch (const nlohmann::json::exception& e) {
            request.parseError = e.what();
        }
        return request;
    }

    auto colonPos = raw.find(':');
    if (colonPos != std::string::npos) {
        request.command = raw.substr(0, colonPos);
        request.payload = raw.substr(colonPos + 1);
    } else {
        request.command = raw;
    }

    auto trimNull = [](std::string& value) {
        auto pos = value.find('\0');
        if (pos != std::string::npos) {
            value.erase(pos);
        }
    };
    trimNull(request.command);
    trimNull(request.payload);
    request.command = toUpper(request.command);

    return request;
}

std::string ZmqCommandServer::dispatchRequest(const ZmqRequest& request) {
    if (!request.parseError.empty()) {
        return buildErrorResponse(request, ErrorCode::IPC_PROTOCOL_ERROR,
                                  "JSON parse error: " + request.parseError);
    }

    auto it = handlers_.find(request.command);
    if (it == handlers_.end()) {
        std::string name = request.command.empty() ? "<empty>" : request.command;
        return buildErrorResponse(request, ErrorCode::IPC_INVALID_COMMAND,
                                  "Unknown command: " + name);
    }

    try {
        return it->second(request);
    } catch (const std::exception& e) {
        LOG_ERROR("ZeroMQ: handler {} threw: {}", request.command, e.what());
        return buildErrorResponse(request, ErrorCode::INTERNAL_UNKNOWN,
                                  std::string("Handler exception: ") + e.what());
    }
}

std::string ZmqCommandServer::buildOkResponse(const ZmqRequest& request,
                                              const nlohmann::json& data,
                                              const std::string& text) {
    if (request.isJson) {
        nlohmann::json resp;
        resp["status"] = "ok";
        if (!data.is_null()) {
            resp["data"] = data;
        }
        return resp.dump();
    }
    if (data.is_null()) {
        return text;
    }
    return text + ":" + data.dump();
}

std::string ZmqCommandServer::buildErrorResponse(const ZmqRequest& request, ErrorCode code,
                                                 const std::string& message) {
    if (request.isJson) {
        nlohmann::json resp;
        resp["status"] = "error";
        resp["error_code"] = ScrobbleEngine::errorCodeToString(code);
        resp["message"] = message;
        return resp.dump();
    }
    return "ERR:" + message;
}

void ZmqCommandServer::serverLoop() {
    while (running_.load()) {
        try {
            zmq::message_t request;
            auto recvResult = repSocket_->recv(request, zmq::recv_flags::none);
            if (!recvResult) {
                continue;  // Receive timeout
            }

            std::string raw(static_cast<char*>(request.data()), request.size());
            std::string response = dispatchRequest(buildRequest(raw));
            repSocket_->send(zmq::buffer(response), zmq::send_flags::none);
        } catch (const zmq::error_t& e) {
            if (running_.load()) {
                LOG_ERROR("ZeroMQ: listener error: {}", e.what());
            }
        }
    }
}

void ZmqCommandServer::cleanupSockets() {
    try {
        if (repSocket_) {
            repSocket_->close();
        }
        if (pubSocket_) {
            pubSocket_->close();
        }
    } catch (const zmq::error_t& e) {
        LOG_DEBUG("ZeroMQ: close failed: {}", e.what());
    }
    repSocket_.reset();
    pubSocket_.reset();
    context_.reset();
}

void ZmqCommandServer::cleanupIpcPath(const std::string& endpoint) const {
    if (!startsWith(endpoint, "ipc://")) {
        return;
    }
    std::string path = endpoint.substr(6);
    if (path.empty()) {
        return;
    }
    std::remove(path.c_str());
}

std::string ZmqCommandServer::derivePubEndpoint(const std::string& endpoint) {
    if (startsWith(endpoint, "tcp://")) {
        auto colonPos = endpoint.rfind(':');
        if (colonPos != std::string::npos && colonPos > 5) {
            const std::string portText = endpoint.substr(colonPos + 1);
            if (!portText.empty() &&
                portText.find_first_not_of("0123456789") == std::string::npos &&
                portText.size() <= 5) {
                int port = std::stoi(portText);
                return endpoint.substr(0, colonPos + 1) + std::to_string(port + 1);
            }
        }
    }
    return endpoint + DaemonConstants::ZEROMQ_PUB_SUFFIX;
}

}  // namespace daemon_ipc
