/*!
 * @file data_source.hpp
 * @brief Public API for data source implementation
 */

#pragma once

#include <optional>

#include <featureprobe/export.hpp>
#include <featureprobe/model.hpp>

namespace fp {

/**
 * @brief Where snapshots come from.
 *
 * The synchronizer calls `fetch` from its own thread on every refresh
 * interval. `close` may be called from any thread and should make an
 * in-flight `fetch` return promptly.
 */
class FP_EXPORT DataSource {
public:
    virtual ~DataSource() = default;

    /**
     * @brief Retrieve a complete snapshot.
     * @return `std::nullopt` on any failure. The failure should be logged by
     * the implementation. The previous snapshot stays in effect.
     */
    virtual std::optional<Repository> fetch() = 0;

    virtual void close() {}
};

} // namespace fp
