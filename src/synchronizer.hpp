#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include <featureprobe/data_source.hpp>

#include "concurrency.hpp"
#include "store.hpp"

namespace fp {

/*
 * Polls a DataSource on a fixed interval and publishes every successful
 * result into the Store. Failed fetches leave the current snapshot in place
 * and are retried on the next tick.
 */
class Synchronizer {
public:
    Synchronizer(
        std::shared_ptr<DataSource> dataSource,
        std::shared_ptr<Store> store,
        std::chrono::milliseconds refreshInterval);

    Synchronizer(const Synchronizer &) = delete;
    Synchronizer &operator=(const Synchronizer &) = delete;

    ~Synchronizer();

    /* Launches the polling thread. With `waitFirstResp` blocks until the first
     * snapshot is published or `startWait` elapses. Returns whether a
     * snapshot is available. */
    bool start(bool waitFirstResp, std::chrono::milliseconds startWait);

    /* cancels any in-flight fetch and joins the polling thread */
    void stop();

    bool initialized() const;

private:
    void run();

    const std::shared_ptr<DataSource> m_dataSource;
    const std::shared_ptr<Store> m_store;
    const std::chrono::milliseconds m_refreshInterval;

    Lifecycle m_lifecycle;
    std::thread m_thread;
    std::mutex m_lock;
    std::condition_variable m_signal;
    bool m_shouldStop;
};

} // namespace fp
