#include <optional>
#include <utility>

#include <featureprobe/logging.hpp>

#include "synchronizer.hpp"

namespace fp {

Synchronizer::Synchronizer(
    std::shared_ptr<DataSource> dataSource,
    std::shared_ptr<Store> store,
    const std::chrono::milliseconds refreshInterval)
    : m_dataSource{std::move(dataSource)},
      m_store{std::move(store)},
      m_refreshInterval{refreshInterval},
      m_lifecycle{},
      m_thread{},
      m_lock{},
      m_signal{},
      m_shouldStop{false}
{}

Synchronizer::~Synchronizer()
{
    stop();
}

bool
Synchronizer::start(const bool waitFirstResp, const std::chrono::milliseconds startWait)
{
    /* stop takes the thread handle under this lock, so it never misses it */
    std::unique_lock<std::mutex> lock(m_lock);

    if (!m_lifecycle.start()) {
        return initialized();
    }

    m_thread = std::thread(&Synchronizer::run, this);

    if (!waitFirstResp) {
        return initialized();
    }

    const bool ready = m_signal.wait_for(lock, startWait,
        [this]() { return m_shouldStop || m_store->initialized(); });

    if (!ready) {
        FP_LOG(LogLevel::Warning, "no snapshot received within %lldms, serving defaults until one arrives",
            static_cast<long long>(startWait.count()));
    }

    return m_store->initialized();
}

void
Synchronizer::run()
{
    for (;;) {
        std::optional<Repository> repository = m_dataSource->fetch();

        std::unique_lock<std::mutex> lock(m_lock);

        if (m_shouldStop) {
            return;
        }

        if (repository) {
            FP_LOG(LogLevel::Trace, "publishing snapshot with %zu toggles and %zu segments",
                repository->toggles.size(), repository->segments.size());
            m_store->publish(std::move(*repository));
            m_signal.notify_all();
        }

        if (m_signal.wait_for(lock, m_refreshInterval, [this]() { return m_shouldStop; })) {
            return;
        }
    }
}

void
Synchronizer::stop()
{
    const Lifecycle::State previous = m_lifecycle.stop();

    if (previous != Lifecycle::State::Running) {
        return;
    }

    std::thread thread;
    {
        std::lock_guard<std::mutex> guard(m_lock);
        m_shouldStop = true;
        thread.swap(m_thread);
    }
    m_dataSource->close();
    m_signal.notify_all();

    if (thread.joinable()) {
        thread.join();
    }
}

bool
Synchronizer::initialized() const
{
    return m_store->initialized();
}

} // namespace fp
