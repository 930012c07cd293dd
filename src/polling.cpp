#include <utility>

#include <featureprobe/logging.hpp>

#include "network.hpp"
#include "polling.hpp"

namespace fp {

PollingDataSource::PollingDataSource(
    std::string togglesUrl,
    std::string serverSdkKey,
    const std::chrono::milliseconds timeout,
    std::shared_ptr<HttpClient> httpClient)
    : m_togglesUrl{std::move(togglesUrl)},
      m_serverSdkKey{std::move(serverSdkKey)},
      m_timeout{timeout},
      m_httpClient{std::move(httpClient)},
      m_closed{false}
{}

std::optional<Repository>
PollingDataSource::fetch()
{
    if (m_closed.load()) {
        return std::nullopt;
    }

    HttpRequest request;
    request.url = m_togglesUrl;
    request.headers = sharedHeaders(m_serverSdkKey);
    request.timeout = m_timeout;
    request.cancel = &m_closed;

    const HttpResponse response = m_httpClient->get(request);

    if (m_closed.load()) {
        FP_LOG(LogLevel::Debug, "poll of %s cancelled", m_togglesUrl.c_str());
        return std::nullopt;
    }

    if (!response.error.empty()) {
        FP_LOG(LogLevel::Error, "poll of %s failed: %s", m_togglesUrl.c_str(), response.error.c_str());
        return std::nullopt;
    }

    if (!response.ok()) {
        FP_LOG(LogLevel::Error, "poll of %s failed with status %ld", m_togglesUrl.c_str(), response.status);
        return std::nullopt;
    }

    return parseRepository(response.body);
}

void
PollingDataSource::close()
{
    m_closed.store(true);
}

} // namespace fp
