/*!
 * @file value.hpp
 * @brief Public API Interface for variation values
 */

#pragma once

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include <featureprobe/export.hpp>

namespace fp {

/**
 * @brief A variation value served by a toggle.
 *
 * Exactly one of four kinds. JSON booleans, numbers and strings are always
 * normalized into their scalar kind on construction, so a `Value` built from
 * `nlohmann::json(true)` is a `Kind::Bool`. Everything else (objects, arrays,
 * null) is held as `Kind::Json`.
 */
class FP_EXPORT Value {
public:
    enum class Kind {
        Bool,
        Number,
        String,
        Json
    };

    /** @brief A JSON null. */
    Value();
    Value(bool value);
    Value(int value);
    Value(double value);
    Value(const char *value);
    Value(std::string value);
    Value(nlohmann::json value);

    Kind kind() const;

    /** @brief The value if `kind() == Kind::Bool`. */
    std::optional<bool> asBool() const;
    /** @brief The value if `kind() == Kind::Number`. */
    std::optional<double> asNumber() const;
    /** @brief The value if `kind() == Kind::String`. */
    std::optional<std::string> asString() const;
    /** @brief Any kind converts to JSON. */
    nlohmann::json toJson() const;

    bool operator==(const Value &other) const;
    bool operator!=(const Value &other) const;

private:
    std::variant<bool, double, std::string, nlohmann::json> m_value;
};

const char *kindToString(Value::Kind kind);

void to_json(nlohmann::json &j, const Value &value);
void from_json(const nlohmann::json &j, Value &value);

} // namespace fp
