#include <chrono>
#include <utility>

#include <featureprobe/user.hpp>

namespace fp {

User::User()
    : m_key{std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
              std::chrono::system_clock::now().time_since_epoch()).count())},
      m_attrs{}
{}

User &
User::stableRollout(std::string key)
{
    m_key = std::move(key);
    return *this;
}

User &
User::with(std::string attribute, std::string value)
{
    m_attrs[std::move(attribute)] = std::move(value);
    return *this;
}

const std::string &
User::key() const
{
    return m_key;
}

bool
User::containsAttr(const std::string &attribute) const
{
    return m_attrs.find(attribute) != m_attrs.end();
}

std::optional<std::string>
User::get(const std::string &attribute) const
{
    const auto it = m_attrs.find(attribute);
    if (it == m_attrs.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::map<std::string, std::string> &
User::attrs() const
{
    return m_attrs;
}

} // namespace fp
