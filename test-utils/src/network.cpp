#include <utility>

#include "test-utils/network.hpp"

MockHttpClient::MockHttpClient() : m_lock{}, m_posted{}, m_response{}, m_gets{}, m_posts{}
{
    m_response.status = 200;
}

fp::HttpResponse
MockHttpClient::get(const fp::HttpRequest &request)
{
    std::lock_guard<std::mutex> guard(m_lock);
    m_gets.push_back(request);
    return m_response;
}

fp::HttpResponse
MockHttpClient::post(const fp::HttpRequest &request)
{
    std::lock_guard<std::mutex> guard(m_lock);
    m_posts.push_back(request);
    m_posted.notify_all();
    return m_response;
}

void
MockHttpClient::setResponse(fp::HttpResponse response)
{
    std::lock_guard<std::mutex> guard(m_lock);
    m_response = std::move(response);
}

std::vector<fp::HttpRequest>
MockHttpClient::gets() const
{
    std::lock_guard<std::mutex> guard(m_lock);
    return m_gets;
}

std::vector<fp::HttpRequest>
MockHttpClient::posts() const
{
    std::lock_guard<std::mutex> guard(m_lock);
    return m_posts;
}

std::size_t
MockHttpClient::postCount() const
{
    std::lock_guard<std::mutex> guard(m_lock);
    return m_posts.size();
}

bool
MockHttpClient::waitForPosts(const std::size_t count, const std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(m_lock);
    return m_posted.wait_for(lock, timeout, [&]() { return m_posts.size() >= count; });
}

StaticDataSource::StaticDataSource() : m_lock{}, m_repository{}, m_fetches{0}, m_closed{false} {}

StaticDataSource::StaticDataSource(fp::Repository repository)
    : m_lock{}, m_repository{std::move(repository)}, m_fetches{0}, m_closed{false}
{}

std::optional<fp::Repository>
StaticDataSource::fetch()
{
    std::lock_guard<std::mutex> guard(m_lock);
    m_fetches++;
    return m_repository;
}

void
StaticDataSource::close()
{
    std::lock_guard<std::mutex> guard(m_lock);
    m_closed = true;
}

void
StaticDataSource::setRepository(std::optional<fp::Repository> repository)
{
    std::lock_guard<std::mutex> guard(m_lock);
    m_repository = std::move(repository);
}

std::size_t
StaticDataSource::fetchCount() const
{
    std::lock_guard<std::mutex> guard(m_lock);
    return m_fetches;
}

bool
StaticDataSource::closed() const
{
    std::lock_guard<std::mutex> guard(m_lock);
    return m_closed;
}
