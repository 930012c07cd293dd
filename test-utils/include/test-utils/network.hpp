#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

#include <featureprobe/data_source.hpp>
#include <featureprobe/network.hpp>

/* Records every request and answers with a configurable response. */
class MockHttpClient : public fp::HttpClient {
public:
    MockHttpClient();

    fp::HttpResponse get(const fp::HttpRequest &request) override;

    fp::HttpResponse post(const fp::HttpRequest &request) override;

    void setResponse(fp::HttpResponse response);

    std::vector<fp::HttpRequest> gets() const;

    std::vector<fp::HttpRequest> posts() const;

    std::size_t postCount() const;

    /* blocks until at least `count` posts were made or the timeout passes */
    bool waitForPosts(std::size_t count, std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex m_lock;
    mutable std::condition_variable m_posted;
    fp::HttpResponse m_response;
    std::vector<fp::HttpRequest> m_gets;
    std::vector<fp::HttpRequest> m_posts;
};

/* Serves whatever repository it currently holds, or fails if none. */
class StaticDataSource : public fp::DataSource {
public:
    StaticDataSource();

    explicit StaticDataSource(fp::Repository repository);

    std::optional<fp::Repository> fetch() override;

    void close() override;

    void setRepository(std::optional<fp::Repository> repository);

    std::size_t fetchCount() const;

    bool closed() const;

private:
    mutable std::mutex m_lock;
    std::optional<fp::Repository> m_repository;
    std::size_t m_fetches;
    bool m_closed;
};
