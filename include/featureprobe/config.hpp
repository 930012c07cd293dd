/*!
 * @file config.hpp
 * @brief Public API Interface for Configuration
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <featureprobe/data_source.hpp>
#include <featureprobe/error.hpp>
#include <featureprobe/export.hpp>
#include <featureprobe/network.hpp>

namespace fp {

/**
 * @brief Client configuration. Intended to be modified until it is passed
 * to `Client::init`, which takes a copy.
 */
class FP_EXPORT Config {
public:
    /**
     * @param[in] remoteUrl Base URL of the FeatureProbe server. A trailing
     * slash is appended if missing.
     * @param[in] serverSdkKey Server side SDK key, sent as the
     * `Authorization` header.
     */
    Config(std::string remoteUrl, std::string serverSdkKey);

    /** @brief Override the toggles path, relative to the remote URL.
     * Defaults to "api/server-sdk/toggles". */
    Config &setTogglesUri(const std::string &uri);

    /** @brief Override the events path, relative to the remote URL.
     * Defaults to "api/events". */
    Config &setEventsUri(const std::string &uri);

    /** @brief Interval between snapshot polls and between event flushes. Also
     * bounds every network call. Defaults to 2000ms. */
    Config &setRefreshInterval(std::chrono::milliseconds interval);

    /** @brief Whether `Client::init` blocks until the first snapshot arrives.
     * Defaults to true. */
    Config &setWaitFirstResp(bool wait);

    /** @brief Upper bound on the `setWaitFirstResp` block. Defaults to
     * 5000ms. */
    Config &setStartWait(std::chrono::milliseconds wait);

    /** @brief Replace the polling data source. */
    Config &setDataSource(std::shared_ptr<DataSource> dataSource);

    /** @brief Replace the libcurl transport. */
    Config &setHttpClient(std::shared_ptr<HttpClient> httpClient);

    const std::string &remoteUrl() const;
    const std::string &togglesUrl() const;
    const std::string &eventsUrl() const;
    const std::string &serverSdkKey() const;
    std::chrono::milliseconds refreshInterval() const;
    bool waitFirstResp() const;
    std::chrono::milliseconds startWait() const;
    const std::shared_ptr<DataSource> &dataSource() const;
    const std::shared_ptr<HttpClient> &httpClient() const;

    /** @brief `std::nullopt` if the configuration can build a client. */
    std::optional<Error> validate() const;

private:
    std::string m_remoteUrl;
    std::string m_togglesUrl;
    std::string m_eventsUrl;
    std::string m_serverSdkKey;
    std::chrono::milliseconds m_refreshInterval;
    bool m_waitFirstResp;
    std::chrono::milliseconds m_startWait;
    std::shared_ptr<DataSource> m_dataSource;
    std::shared_ptr<HttpClient> m_httpClient;
};

} // namespace fp
