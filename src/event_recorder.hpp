#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <featureprobe/network.hpp>

#include "concurrency.hpp"
#include "events.hpp"

namespace fp {

/*
 * Buffers access events and ships them in aggregated batches.
 *
 * `record` only appends under a mutex. A dedicated thread wakes every flush
 * interval, swaps the pending list for an empty one and posts the batch
 * after releasing the lock. Delivery is best effort: a failed post is logged
 * and the batch is dropped.
 */
class EventRecorder {
public:
    EventRecorder(
        std::string eventsUrl,
        std::string serverSdkKey,
        std::chrono::milliseconds flushInterval,
        std::shared_ptr<HttpClient> httpClient);

    EventRecorder(const EventRecorder &) = delete;
    EventRecorder &operator=(const EventRecorder &) = delete;

    /* stops, which flushes */
    ~EventRecorder();

    /* launches the flush thread, later calls do nothing */
    void start();

    /* Runs exactly one final flush and returns once it has finished. Later
     * calls do nothing. */
    void stop();

    /* events recorded after stop are discarded */
    void record(AccessEvent event);

    /* Drains and delivers pending events. Returns false if there was
     * something to send and delivery failed. */
    bool flush();

    std::size_t pending() const;

private:
    void run();

    const std::string m_eventsUrl;
    const std::string m_serverSdkKey;
    const std::chrono::milliseconds m_flushInterval;
    const std::shared_ptr<HttpClient> m_httpClient;

    mutable std::mutex m_eventsLock;
    std::vector<AccessEvent> m_events;

    Lifecycle m_lifecycle;
    std::thread m_thread;
    std::mutex m_signalLock;
    std::condition_variable m_signal;
    bool m_shouldStop;
};

} // namespace fp
