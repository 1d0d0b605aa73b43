/**
 * @file http_client.h
 * @brief HTTP transport used by the service adapters
 *
 * HttpTransport is the seam the adapters are tested through; CurlHttpClient
 * is the libcurl implementation used by the daemon.
 */

#pragma once

#include "core/error_codes.h"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace scrobble_services {

using HeaderList = std::vector<std::pair<std::string, std::string>>;
using FormParams = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    enum class Method { Get, Post };

    Method method = Method::Get;
    std::string url;
    HeaderList headers;
    std::string body;
    std::string contentType;  // Sent as Content-Type when body is non-empty
};

struct HttpResponse {
    long status = 0;  // 0 when the transfer itself failed
    std::string body;
    ScrobbleEngine::ErrorCode transportError = ScrobbleEngine::ErrorCode::OK;
    std::string error;

    bool transportOk() const {
        return transportError == ScrobbleEngine::ErrorCode::OK;
    }
};

class HttpTransport {
   public:
    virtual ~HttpTransport() = default;

    // Must be callable from several threads at once.
    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

/**
 * @brief libcurl transport (one easy handle per request)
 */
class CurlHttpClient : public HttpTransport {
   public:
    explicit CurlHttpClient(std::chrono::milliseconds timeout);

    HttpResponse execute(const HttpRequest& request) override;

   private:
    std::chrono::milliseconds timeout_;
};

/**
 * @brief RAII curl_global_init / curl_global_cleanup
 *
 * Create one before any other thread starts.
 */
class CurlGlobal {
   public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const {
        return ok_;
    }

   private:
    bool ok_ = false;
};

/**
 * @brief application/x-www-form-urlencoded body (curl_easy_escape per key and value)
 */
std::string encodeForm(const FormParams& params);

}  // namespace scrobble_services
