#include <utility>

#include <featureprobe/value.hpp>

namespace fp {

Value::Value() : m_value{nlohmann::json()} {}

Value::Value(const bool value) : m_value{value} {}

Value::Value(const int value) : m_value{static_cast<double>(value)} {}

Value::Value(const double value) : m_value{value} {}

Value::Value(const char *const value) : m_value{std::string(value ? value : "")} {}

Value::Value(std::string value) : m_value{std::move(value)} {}

Value::Value(nlohmann::json value) : m_value{nlohmann::json()}
{
    if (value.is_boolean()) {
        m_value = value.get<bool>();
    } else if (value.is_number()) {
        m_value = value.get<double>();
    } else if (value.is_string()) {
        m_value = value.get<std::string>();
    } else {
        m_value = std::move(value);
    }
}

Value::Kind
Value::kind() const
{
    switch (m_value.index()) {
        case 0: return Kind::Bool;
        case 1: return Kind::Number;
        case 2: return Kind::String;
        default: return Kind::Json;
    }
}

std::optional<bool>
Value::asBool() const
{
    if (const bool *const value = std::get_if<bool>(&m_value)) {
        return *value;
    }
    return std::nullopt;
}

std::optional<double>
Value::asNumber() const
{
    if (const double *const value = std::get_if<double>(&m_value)) {
        return *value;
    }
    return std::nullopt;
}

std::optional<std::string>
Value::asString() const
{
    if (const std::string *const value = std::get_if<std::string>(&m_value)) {
        return *value;
    }
    return std::nullopt;
}

nlohmann::json
Value::toJson() const
{
    return std::visit([](const auto &value) { return nlohmann::json(value); }, m_value);
}

bool
Value::operator==(const Value &other) const
{
    return m_value == other.m_value;
}

bool
Value::operator!=(const Value &other) const
{
    return !(*this == other);
}

const char *
kindToString(const Value::Kind kind)
{
    switch (kind) {
        case Value::Kind::Bool:   return "bool";
        case Value::Kind::Number: return "number";
        case Value::Kind::String: return "string";
        case Value::Kind::Json:   return "json";
    }

    return "unknown";
}

void
to_json(nlohmann::json &j, const Value &value)
{
    j = value.toJson();
}

void
from_json(const nlohmann::json &j, Value &value)
{
    value = Value(j);
}

} // namespace fp
