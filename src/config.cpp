#include <utility>

#include <featureprobe/config.hpp>

#include "utility.hpp"

namespace fp {

static const char *const DEFAULT_TOGGLES_URI = "api/server-sdk/toggles";
static const char *const DEFAULT_EVENTS_URI = "api/events";

static std::string
withTrailingSlash(std::string url)
{
    if (url.empty() || url.back() != '/') {
        url.push_back('/');
    }
    return url;
}

Config::Config(std::string remoteUrl, std::string serverSdkKey)
    : m_remoteUrl{withTrailingSlash(std::move(remoteUrl))},
      m_togglesUrl{m_remoteUrl + DEFAULT_TOGGLES_URI},
      m_eventsUrl{m_remoteUrl + DEFAULT_EVENTS_URI},
      m_serverSdkKey{std::move(serverSdkKey)},
      m_refreshInterval{2000},
      m_waitFirstResp{true},
      m_startWait{5000},
      m_dataSource{},
      m_httpClient{}
{}

Config &
Config::setTogglesUri(const std::string &uri)
{
    m_togglesUrl = m_remoteUrl + uri;
    return *this;
}

Config &
Config::setEventsUri(const std::string &uri)
{
    m_eventsUrl = m_remoteUrl + uri;
    return *this;
}

Config &
Config::setRefreshInterval(const std::chrono::milliseconds interval)
{
    m_refreshInterval = interval;
    return *this;
}

Config &
Config::setWaitFirstResp(const bool wait)
{
    m_waitFirstResp = wait;
    return *this;
}

Config &
Config::setStartWait(const std::chrono::milliseconds wait)
{
    m_startWait = wait;
    return *this;
}

Config &
Config::setDataSource(std::shared_ptr<DataSource> dataSource)
{
    m_dataSource = std::move(dataSource);
    return *this;
}

Config &
Config::setHttpClient(std::shared_ptr<HttpClient> httpClient)
{
    m_httpClient = std::move(httpClient);
    return *this;
}

const std::string &
Config::remoteUrl() const
{
    return m_remoteUrl;
}

const std::string &
Config::togglesUrl() const
{
    return m_togglesUrl;
}

const std::string &
Config::eventsUrl() const
{
    return m_eventsUrl;
}

const std::string &
Config::serverSdkKey() const
{
    return m_serverSdkKey;
}

std::chrono::milliseconds
Config::refreshInterval() const
{
    return m_refreshInterval;
}

bool
Config::waitFirstResp() const
{
    return m_waitFirstResp;
}

std::chrono::milliseconds
Config::startWait() const
{
    return m_startWait;
}

const std::shared_ptr<DataSource> &
Config::dataSource() const
{
    return m_dataSource;
}

const std::shared_ptr<HttpClient> &
Config::httpClient() const
{
    return m_httpClient;
}

std::optional<Error>
Config::validate() const
{
    const bool http = startsWith(m_remoteUrl, "http://");
    const bool https = startsWith(m_remoteUrl, "https://");

    if (!http && !https) {
        return Error{ErrorCode::InvalidRemoteUrl,
            "remote url '" + m_remoteUrl + "' must start with http:// or https://"};
    }

    /* scheme followed by at least one host character and the trailing slash */
    const std::string::size_type schemeLength = http ? 7 : 8;
    if (m_remoteUrl.size() <= schemeLength + 1 || m_remoteUrl[schemeLength] == '/') {
        return Error{ErrorCode::InvalidRemoteUrl, "remote url '" + m_remoteUrl + "' has no host"};
    }

    if (m_serverSdkKey.empty() && !m_dataSource) {
        return Error{ErrorCode::InvalidSdkKey, "server sdk key must not be empty"};
    }

    if (m_refreshInterval.count() <= 0) {
        return Error{ErrorCode::InvalidRefreshInterval, "refresh interval must be positive"};
    }

    return std::nullopt;
}

} // namespace fp
