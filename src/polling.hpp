#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <featureprobe/data_source.hpp>
#include <featureprobe/network.hpp>

namespace fp {

/* fetches the full snapshot from the toggles endpoint on every call */
class PollingDataSource : public DataSource {
public:
    PollingDataSource(
        std::string togglesUrl,
        std::string serverSdkKey,
        std::chrono::milliseconds timeout,
        std::shared_ptr<HttpClient> httpClient);

    std::optional<Repository> fetch() override;

    /* aborts the in-flight request, if any, and fails later fetches */
    void close() override;

private:
    const std::string m_togglesUrl;
    const std::string m_serverSdkKey;
    const std::chrono::milliseconds m_timeout;
    const std::shared_ptr<HttpClient> m_httpClient;
    std::atomic<bool> m_closed;
};

} // namespace fp
