#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace etcalc {
// Parse a JSON file; ConfigurationError if it cannot be opened or parsed
nlohmann::json load_json(const std::string& path);
// Replace ${VAR} in every string value by the environment variable;
// ConfigurationError for a variable that is not set
void expand_env(nlohmann::json& j);
} // namespace etcalc
