#pragma once

#include <optional>

#include <nlohmann/json.hpp>

#include <featureprobe/model.hpp>

namespace fp {

/* Each decoder throws nlohmann::json::exception on a missing required field
 * or a field of the wrong type. */
Condition decodeCondition(const nlohmann::json &json);
Serve decodeServe(const nlohmann::json &json);
Toggle decodeToggle(const nlohmann::json &json);
Segment decodeSegment(const nlohmann::json &json);

/* never throws, entries that fail to decode are logged and skipped */
std::optional<Repository> decodeRepository(const nlohmann::json &json);

} // namespace fp
