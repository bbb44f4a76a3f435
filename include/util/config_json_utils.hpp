#pragma once

#include "util/pack_options.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace fpack::config::detail {

// Values substituted into string fields of a config file.
struct ConfigVars {
    std::string config_path;
    std::string config_dir;
};

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
std::string ExpandConfigVars(const std::string& value, const ConfigVars& vars);
bool FillOptionsFromJson(const nlohmann::json& j, const ConfigVars& vars, PackOptions& opt,
                         std::string& err);

} // namespace fpack::config::detail
