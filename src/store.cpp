#include <utility>

#include "store.hpp"

namespace fp {

Store::Store() : m_repository{std::make_shared<const Repository>()}, m_initialized{false} {}

std::shared_ptr<const Repository>
Store::snapshot() const
{
    return std::atomic_load(&m_repository);
}

void
Store::publish(Repository repository)
{
    std::atomic_store(&m_repository,
        std::shared_ptr<const Repository>(std::make_shared<const Repository>(std::move(repository))));
    m_initialized.store(true);
}

void
Store::clear()
{
    std::atomic_store(&m_repository, std::shared_ptr<const Repository>(std::make_shared<const Repository>()));
}

bool
Store::initialized() const
{
    return m_initialized.load();
}

} // namespace fp
