/*!
 * @file user.hpp
 * @brief Public API Interface for User construction
 */

#pragma once

#include <map>
#include <optional>
#include <string>

#include <featureprobe/export.hpp>

namespace fp {

/**
 * @brief The subject of an evaluation.
 *
 * The key is the identity used for percentage rollout. A fresh user gets a
 * key derived from the construction time, so two users built separately land
 * in unrelated buckets. Use `stableRollout` to pin the key when the same
 * person must always receive the same variation.
 */
class FP_EXPORT User {
public:
    User();

    /** @brief Pin the hashing identity of this user. */
    User &stableRollout(std::string key);

    /** @brief Set or overwrite a custom attribute. */
    User &with(std::string attribute, std::string value);

    const std::string &key() const;

    bool containsAttr(const std::string &attribute) const;

    std::optional<std::string> get(const std::string &attribute) const;

    const std::map<std::string, std::string> &attrs() const;

private:
    std::string m_key;
    std::map<std::string, std::string> m_attrs;
};

} // namespace fp
