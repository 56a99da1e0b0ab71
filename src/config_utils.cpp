#include "config_utils.hpp"

#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

static constexpr const char* SUBMODULES_KEY = "submodules";

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

static bool read_yaml_scalars(const YAML::Node& map, std::map<std::string, std::string>& out,
                              const std::string& prefix, std::string& error) {
    for (auto it = map.begin(); it != map.end(); ++it) {
        if (!it->first.IsScalar())
            continue;
        std::string s;
        if (!to_string_value(it->second, s)) {
            error = "'" + it->first.Scalar() + "' must be a scalar";
            return false;
        }
        out[prefix + it->first.Scalar()] = s;
    }
    return true;
}

bool load_yaml_config(const std::string& path, ConfigOptions& opts,
                      SubmoduleConfigs& submodule_opts, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    try {
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key_name = it->first.Scalar();
            const YAML::Node& node = it->second;
            if (key_name == SUBMODULES_KEY) {
                if (!node.IsMap() && !node.IsNull()) {
                    error = "'submodules' must be a map";
                    return false;
                }
                if (node.IsNull())
                    continue;
                for (auto sub = node.begin(); sub != node.end(); ++sub) {
                    if (!sub->first.IsScalar())
                        continue;
                    const std::string name = sub->first.Scalar();
                    auto& m = submodule_opts[name];
                    if (sub->second.IsNull())
                        continue;
                    if (!sub->second.IsMap()) {
                        error = "submodule '" + name + "' must be a map";
                        return false;
                    }
                    if (!read_yaml_scalars(sub->second, m, "", error)) {
                        error = "submodule '" + name + "': " + error;
                        return false;
                    }
                }
            } else if (node.IsMap()) {
                if (!read_yaml_scalars(node, opts, "--", error))
                    return false;
            } else {
                std::string s;
                if (!to_string_value(node, s)) {
                    error = "'" + key_name + "' must be a scalar";
                    return false;
                }
                opts["--" + key_name] = s;
            }
        }
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

static bool read_json_scalars(const nlohmann::json& obj, std::map<std::string, std::string>& out,
                              const std::string& prefix, std::string& error) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        std::string s;
        if (!to_string_value(it.value(), s)) {
            error = "'" + it.key() + "' must be a scalar";
            return false;
        }
        out[prefix + it.key()] = s;
    }
    return true;
}

bool load_json_config(const std::string& path, ConfigOptions& opts,
                      SubmoduleConfigs& submodule_opts, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    nlohmann::json root;
    try {
        ifs >> root;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
    if (!root.is_object()) {
        error = "Root JSON value is not an object";
        return false;
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
        const nlohmann::json& val = it.value();
        if (it.key() == SUBMODULES_KEY) {
            if (val.is_null())
                continue;
            if (!val.is_object()) {
                error = "'submodules' must be an object";
                return false;
            }
            for (auto sub = val.begin(); sub != val.end(); ++sub) {
                auto& m = submodule_opts[sub.key()];
                if (sub.value().is_null())
                    continue;
                if (!sub.value().is_object()) {
                    error = "submodule '" + sub.key() + "' must be an object";
                    return false;
                }
                if (!read_json_scalars(sub.value(), m, "", error)) {
                    error = "submodule '" + sub.key() + "': " + error;
                    return false;
                }
            }
        } else if (val.is_object()) {
            if (!read_json_scalars(val, opts, "--", error))
                return false;
        } else {
            std::string s;
            if (!to_string_value(val, s)) {
                error = "'" + it.key() + "' must be a scalar";
                return false;
            }
            opts["--" + it.key()] = s;
        }
    }
    return true;
}
