/*!
 * @file network.hpp
 * @brief Public API Interface for the HTTP transport
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <featureprobe/export.hpp>

namespace fp {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::milliseconds timeout{0};
    /* when set, the transfer is aborted as soon as it reads true */
    const std::atomic<bool> *cancel = nullptr;
};

struct HttpResponse {
    long status = 0;
    std::string body;
    /* transport level failure, empty if a response was received */
    std::string error;

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

/**
 * @brief Blocking HTTP transport used for snapshot polling and event
 * delivery. Implementations must allow concurrent calls from different
 * threads.
 */
class FP_EXPORT HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const HttpRequest &request) = 0;

    virtual HttpResponse post(const HttpRequest &request) = 0;
};

/** @brief The default transport, backed by libcurl. */
FP_EXPORT std::shared_ptr<HttpClient> makeCurlHttpClient();

} // namespace fp
