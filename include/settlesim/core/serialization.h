#pragma once

#include <string>

#include "settlesim/core/entities.h"
#include "settlesim/util/json.h"

namespace settlesim {

// Settlement save format version written by settlement_to_json().
constexpr int kCurrentSaveVersion = 1;

// Serialize a settlement aggregate into an in-memory JSON document.
// Timestamps are ISO-8601 UTC strings; unset (0) timestamps are omitted.
json::Value settlement_to_json_value(const Settlement& s);

// Pretty-printed JSON text with sorted keys (stable diffs between saves).
std::string settlement_to_json(const Settlement& s);

// Parse a settlement from JSON text. Throws std::runtime_error on malformed input.
Settlement settlement_from_json(const std::string& json_text);
Settlement settlement_from_json_value(const json::Value& v);

} // namespace settlesim
