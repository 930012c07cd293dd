#pragma once

#include <cstdint>
#include <string>

namespace fp {

std::int64_t getUnixMilliseconds();

std::int64_t getUnixSeconds();

bool startsWith(const std::string &text, const std::string &prefix);

bool endsWith(const std::string &text, const std::string &suffix);

/* strict parsers, the whole string must be consumed */
bool parseInt64(const std::string &text, std::int64_t &result);

bool parseDouble(const std::string &text, double &result);

} // namespace fp
