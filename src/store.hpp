#pragma once

#include <atomic>
#include <memory>

#include <featureprobe/model.hpp>

namespace fp {

/*
 * Holds the current snapshot. Readers take a reference counted handle to an
 * immutable Repository, so they never lock and never see a partial update.
 * Writers replace the whole Repository.
 */
class Store {
public:
    Store();

    /* never returns null */
    std::shared_ptr<const Repository> snapshot() const;

    void publish(Repository repository);

    /* replace with an empty repository, keeps the initialized flag */
    void clear();

    bool initialized() const;

private:
    std::shared_ptr<const Repository> m_repository;
    std::atomic<bool> m_initialized;
};

} // namespace fp
