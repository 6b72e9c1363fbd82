#pragma once

#include <json/json.h>
#include <string>

namespace confrun {

// Parse a JSON document. Returns false and fills `errors` when the text is not
// valid JSON or has trailing garbage.
bool parse_json(const std::string& text, Json::Value& out, std::string* errors = nullptr);

// Serialize compactly (no indentation, no trailing newline)
std::string to_json(const Json::Value& value);

} // namespace confrun
