#pragma once
#include "core/Error.hpp"
#include "type/Value.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace SS {

// Mapping entries are emitted in sorted key order so dumps are deterministic.
[[nodiscard]] auto toJson(Value const& value) -> nlohmann::json;

// JSON null has no Value counterpart and is rejected as MalformedInput. Non-negative
// integers that fit in int64 become Integer; larger ones become Unsigned.
[[nodiscard]] auto fromJson(nlohmann::json const& json) -> Expected<Value>;

// Compact JSON rendering used by diagnostics.
[[nodiscard]] auto describeValue(Value const& value) -> std::string;

} // namespace SS
