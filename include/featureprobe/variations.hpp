/*!
 * @file variations.hpp
 * @brief Public API Interface for evaluation results
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace fp {

/**
 * @brief The outcome of a detailed evaluation.
 *
 * `reason` is always set. `ruleIndex` is present only when a targeting rule
 * matched, and `version` only when the toggle was found.
 */
template <typename T>
struct Detail {
    T value;
    std::optional<int> ruleIndex;
    std::optional<std::uint64_t> version;
    std::string reason;
};

using BoolDetail = Detail<bool>;
using StringDetail = Detail<std::string>;
using NumberDetail = Detail<double>;
using JsonDetail = Detail<nlohmann::json>;

} // namespace fp
