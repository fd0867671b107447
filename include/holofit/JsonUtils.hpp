#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace holofit {
nlohmann::json load_json(const std::string& path);
nlohmann::ordered_json load_ordered_json(const std::string& path);
void save_json(const std::string& path, const nlohmann::json& j, int indent = 2);

/* replaces ${VAR} in every string value by the environment variable */
void expand_env(nlohmann::ordered_json& j);
std::string expand_env(const std::string& s);

/* finite doubles are plain numbers, ±inf / nan are the strings "inf", "-inf", "nan" */
nlohmann::json real_to_json(double x);
double real_from_json(const nlohmann::json& j);
} // namespace holofit
