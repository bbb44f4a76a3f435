#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

#include <cerrno>
#include <filesystem>

namespace fpack::config {

Result PackConfigFile::LoadFile(const std::string& path) {
    jobs_.clear();

    std::error_code ec;
    const auto abs = std::filesystem::absolute(path, ec).lexically_normal();
    if (ec) return Result::Fail(ec.value(), "Config: cannot resolve " + path);
    const detail::ConfigVars vars{.config_path = abs.string(),
                                  .config_dir = abs.parent_path().string()};

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(vars.config_path, json, err)) {
        return Result::Fail(EINVAL, "Config: " + err);
    }

    std::vector<nlohmann::json> entries;
    if (auto it = json.find("jobs"); it != json.end()) {
        if (!it->is_array() || it->empty()) {
            return Result::Fail(EINVAL, "Config: 'jobs' must be a non-empty array in " + path);
        }
        entries.assign(it->begin(), it->end());
    } else {
        entries.push_back(json);
    }

    for (size_t i = 0; i < entries.size(); ++i) {
        PackOptions opt;
        if (!detail::FillOptionsFromJson(entries[i], vars, opt, err)) {
            return Result::Fail(EINVAL, "Config: job " + std::to_string(i + 1) + ": " + err + " in " + path);
        }
        jobs_.push_back(std::move(opt));
    }
    return Result::Ok();
}

} // namespace fpack::config
