#include <cerrno>
#include <chrono>
#include <cstdlib>

#include "utility.hpp"

namespace fp {

std::int64_t
getUnixMilliseconds()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::int64_t
getUnixSeconds()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool
startsWith(const std::string &text, const std::string &prefix)
{
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool
endsWith(const std::string &text, const std::string &suffix)
{
    return text.size() >= suffix.size() &&
        text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool
parseInt64(const std::string &text, std::int64_t &result)
{
    char *end = nullptr;

    if (text.empty()) {
        return false;
    }

    errno = 0;
    const long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return false;
    }

    result = static_cast<std::int64_t>(parsed);
    return true;
}

bool
parseDouble(const std::string &text, double &result)
{
    char *end = nullptr;

    if (text.empty()) {
        return false;
    }

    errno = 0;
    const double parsed = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return false;
    }

    result = parsed;
    return true;
}

} // namespace fp
