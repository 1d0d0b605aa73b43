#include "services/http_client.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <curl/curl.h>
#include <memory>

namespace scrobble_services {

using ScrobbleEngine::ErrorCode;

namespace {

struct EasyDeleter {
    void operator()(CURL* handle) const {
        curl_easy_cleanup(handle);
    }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const {
        curl_slist_free_all(list);
    }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderSlist = std::unique_ptr<curl_slist, SlistDeleter>;

size_t writeCallback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(data, size * nmemb);
    return size * nmemb;
}

ErrorCode mapCurlCode(CURLcode code) {
    switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
        return ErrorCode::NETWORK_TIMEOUT;
    default:
        return ErrorCode::NETWORK_ERROR;
    }
}

std::string escape(CURL* handle, const std::string& value) {
    char* escaped = curl_easy_escape(handle, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        return {};
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

}  // namespace

CurlGlobal::CurlGlobal() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    ok_ = (rc == CURLE_OK);
    if (!ok_) {
        LOG_ERROR("curl_global_init failed: {}", curl_easy_strerror(rc));
    }
}

CurlGlobal::~CurlGlobal() {
    if (ok_) {
        curl_global_cleanup();
    }
}

std::string encodeForm(const FormParams& params) {
    EasyHandle handle(curl_easy_init());
    std::string body;
    for (const auto& [key, value] : params) {
        if (!body.empty()) {
            body += '&';
        }
        body += escape(handle.get(), key);
        body += '=';
        body += escape(handle.get(), value);
    }
    return body;
}

CurlHttpClient::CurlHttpClient(std::chrono::milliseconds timeout) : timeout_(timeout) {}

HttpResponse CurlHttpClient::execute(const HttpRequest& request) {
    HttpResponse response;

    EasyHandle handle(curl_easy_init());
    if (!handle) {
        response.transportError = ErrorCode::NETWORK_ERROR;
        response.error = "curl_easy_init failed";
        return response;
    }

    HeaderSlist headers;
    auto appendHeader = [&headers](const std::string& line) {
        curl_slist* next = curl_slist_append(headers.get(), line.c_str());
        if (next) {
            headers.release();
            headers.reset(next);
        }
    };
    for (const auto& [name, value] : request.headers) {
        appendHeader(name + ": " + value);
    }
    if (!request.body.empty() && !request.contentType.empty()) {
        appendHeader("Content-Type: " + request.contentType);
    }

    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, DaemonConstants::USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    }
    if (request.method == HttpRequest::Method::Post) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        response.transportError = mapCurlCode(rc);
        response.error = curl_easy_strerror(rc);
        LOG_DEBUG("HTTP {} failed: {}", request.url, response.error);
        return response;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    LOG_TRACE("HTTP {} -> {}", request.url, response.status);
    return response;
}

}  // namespace scrobble_services
