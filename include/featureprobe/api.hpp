/*!
 * @file api.hpp
 * @brief Public API. Include this for every public operation.
 */

#pragma once

/** @brief The current SDK version string. This value adheres to semantic
 * versioning and is included in the HTTP user agent sent to FeatureProbe.
 */
#define FP_SDK_VERSION "1.0.0"

#include <featureprobe/client.hpp>
#include <featureprobe/config.hpp>
#include <featureprobe/data_source.hpp>
#include <featureprobe/error.hpp>
#include <featureprobe/logging.hpp>
#include <featureprobe/model.hpp>
#include <featureprobe/network.hpp>
#include <featureprobe/user.hpp>
#include <featureprobe/value.hpp>
#include <featureprobe/variations.hpp>

namespace fp {

/** @brief Returns the SDK version specified by `FP_SDK_VERSION`. */
FP_EXPORT const char *version();

} // namespace fp
