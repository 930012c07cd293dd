#include <utility>

#include <featureprobe/logging.hpp>

#include "event_recorder.hpp"
#include "network.hpp"

namespace fp {

EventRecorder::EventRecorder(
    std::string eventsUrl,
    std::string serverSdkKey,
    const std::chrono::milliseconds flushInterval,
    std::shared_ptr<HttpClient> httpClient)
    : m_eventsUrl{std::move(eventsUrl)},
      m_serverSdkKey{std::move(serverSdkKey)},
      m_flushInterval{flushInterval},
      m_httpClient{std::move(httpClient)},
      m_eventsLock{},
      m_events{},
      m_lifecycle{},
      m_thread{},
      m_signalLock{},
      m_signal{},
      m_shouldStop{false}
{}

EventRecorder::~EventRecorder()
{
    stop();
}

void
EventRecorder::start()
{
    /* stop takes the thread handle under this lock, so it never misses it */
    std::lock_guard<std::mutex> guard(m_signalLock);

    if (!m_lifecycle.start()) {
        return;
    }

    m_thread = std::thread(&EventRecorder::run, this);
}

void
EventRecorder::stop()
{
    const Lifecycle::State previous = m_lifecycle.stop();

    if (previous == Lifecycle::State::Stopped) {
        return;
    }

    if (previous == Lifecycle::State::Created) {
        flush();
        return;
    }

    std::thread thread;
    {
        std::lock_guard<std::mutex> guard(m_signalLock);
        m_shouldStop = true;
        thread.swap(m_thread);
    }
    m_signal.notify_all();

    if (thread.joinable()) {
        thread.join();
    }
}

void
EventRecorder::run()
{
    std::unique_lock<std::mutex> lock(m_signalLock);

    for (;;) {
        const bool stopping = m_signal.wait_for(lock, m_flushInterval, [this]() { return m_shouldStop; });

        lock.unlock();
        flush();
        lock.lock();

        if (stopping) {
            FP_LOG(LogLevel::Debug, "event recorder stopped");
            return;
        }
    }
}

void
EventRecorder::record(AccessEvent event)
{
    /* checked under the lock the final flush drains with, so an event is
     * either in that flush or discarded */
    std::lock_guard<std::mutex> guard(m_eventsLock);

    if (m_lifecycle.state() == Lifecycle::State::Stopped) {
        FP_LOG(LogLevel::Trace, "discarding event for '%s', recorder stopped", event.key.c_str());
        return;
    }

    m_events.push_back(std::move(event));
}

bool
EventRecorder::flush()
{
    std::vector<AccessEvent> events;

    {
        std::lock_guard<std::mutex> guard(m_eventsLock);
        events.swap(m_events);
    }

    if (events.empty()) {
        return true;
    }

    const Access access = buildAccess(events);

    HttpRequest request;
    request.url = m_eventsUrl;
    request.headers = sharedHeaders(m_serverSdkKey);
    request.body = packEvents(events, access).dump();
    request.timeout = m_flushInterval;

    const HttpResponse response = m_httpClient->post(request);

    if (!response.error.empty()) {
        FP_LOG(LogLevel::Error, "report %zu events failed: %s", events.size(), response.error.c_str());
        return false;
    }

    if (!response.ok()) {
        FP_LOG(LogLevel::Error, "report %zu events failed with status %ld", events.size(), response.status);
        return false;
    }

    FP_LOG(LogLevel::Trace, "reported %zu events", events.size());
    return true;
}

std::size_t
EventRecorder::pending() const
{
    std::lock_guard<std::mutex> guard(m_eventsLock);
    return m_events.size();
}

} // namespace fp
