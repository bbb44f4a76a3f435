#include "util/config_json_utils.hpp"

#include "util/path_utils.hpp"

#include <fstream>

namespace fpack::config::detail {

namespace {

std::string* StringField(PackOptions& opt, const std::string& key) {
    if (key == "release") return &opt.release;
    if (key == "factory") return &opt.factory;
    if (key == "board") return &opt.board;
    if (key == "firmware_updater") return &opt.firmware_updater;
    if (key == "hwid_updater") return &opt.hwid_updater;
    if (key == "complete_script") return &opt.complete_script;
    if (key == "subfolder") return &opt.subfolder;
    if (key == "usbimg") return &opt.usbimg;
    if (key == "install_shim") return &opt.install_shim;
    if (key == "diskimg") return &opt.diskimg;
    if (key == "omaha_dir") return &opt.omaha_dir;
    if (key == "scratch_dir") return &opt.scratch_dir;
    if (key == "shim_builder") return &opt.shim_builder;
    return nullptr;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    // Non-negative integer literals parse as unsigned; negatives as signed.
    if (!it->is_number_unsigned()) {
        err = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    out = it->get<std::uint64_t>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

std::string ExpandConfigVars(const std::string& value, const ConfigVars& vars) {
    std::string out = value;
    ReplaceAll(out, "${CONFIG_PATH}", vars.config_path);
    ReplaceAll(out, "${CONFIG_DIR}", vars.config_dir);
    return out;
}

bool FillOptionsFromJson(const nlohmann::json& j, const ConfigVars& vars, PackOptions& opt,
                         std::string& err) {
    if (!j.is_object()) {
        err = "job must be a JSON object";
        return false;
    }

    for (const auto& [key, val] : j.items()) {
        if (key == "preserve" || key == "detect_release_image" || key == "sectors")
            continue;
        std::string* field = StringField(opt, key);
        if (!field) {
            err = "unknown key '" + key + "'";
            return false;
        }
        if (!val.is_string()) {
            err = "'" + key + "' must be a string";
            return false;
        }
        *field = ExpandConfigVars(val.get<std::string>(), vars);
    }

    if (!GetBoolIfPresent(j, "preserve", opt.preserve, err))
        return false;
    if (!GetBoolIfPresent(j, "detect_release_image", opt.detect_release_image, err))
        return false;
    if (!GetU64IfPresent(j, "sectors", opt.sectors, err))
        return false;

    return true;
}

} // namespace fpack::config::detail
