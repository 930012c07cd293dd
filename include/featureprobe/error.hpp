/*!
 * @file error.hpp
 * @brief Public API Interface for construction errors
 */

#pragma once

#include <string>

namespace fp {

enum class ErrorCode {
    InvalidRemoteUrl = 1,
    InvalidSdkKey,
    InvalidRefreshInterval
};

struct Error {
    ErrorCode code;
    std::string msg;
};

} // namespace fp
