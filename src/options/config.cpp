// options/config.cpp
//
// Load the config file, the environment and per-submodule overrides.

#include <climits>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

fs::path load_config_file(const ArgParser& parser, ConfigOptions& cfg_opts,
                          SubmoduleConfigs& submodule_opts) {
    if (parser.has_flag("--config-yaml") && parser.has_flag("--config-json"))
        throw std::runtime_error("--config-yaml and --config-json are mutually exclusive");
    fs::path config_file;
    if (parser.has_flag("--config-yaml")) {
        std::string cfg = parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(cfg, cfg_opts, submodule_opts, err))
            throw std::runtime_error("Failed to load config " + cfg + ": " + err);
        config_file = cfg;
    }
    if (parser.has_flag("--config-json")) {
        std::string cfg = parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        std::string err;
        if (!load_json_config(cfg, cfg_opts, submodule_opts, err))
            throw std::runtime_error("Failed to load config " + cfg + ": " + err);
        config_file = cfg;
    }
    return config_file;
}

static void env_value(const char* name, std::string& out) {
    const char* v = std::getenv(name);
    if (v && *v)
        out = v;
}

EnvironmentOptions read_environment() {
    EnvironmentOptions env;
    env_value("GH_API", env.github_api);
    env_value("GH_API_TOKEN", env.github_token);
    env_value("GL_API", env.gitlab_api);
    env_value("GITLAB_API_TOKEN", env.gitlab_token);
    env_value("XF_BASE_URL", env.forum_base_url);
    env_value("XF_DONOTREPLY_KEY", env.forum_api_key);
    env_value("XF_API_USER", env.forum_api_user);
    env_value("GITHUB_REPOSITORY", env.github_repository);
    env_value("GITHUB_OUTPUT", env.github_output);
    std::string thread;
    env_value("XF_THREAD_ID", thread);
    if (!thread.empty()) {
        bool ok = false;
        long id = parse_long(thread, 1, LONG_MAX, ok);
        if (ok)
            env.forum_thread_id = id;
    }
    return env;
}

std::map<std::string, SubmoduleOverride> parse_submodule_overrides(
    const SubmoduleConfigs& submodule_opts) {
    std::map<std::string, SubmoduleOverride> overrides;
    for (const auto& [key, settings] : submodule_opts) {
        SubmoduleOverride ov;
        for (const auto& [name, val] : settings) {
            if (name == "branch") {
                if (!val.empty())
                    ov.branch = val;
            } else if (name == "skip") {
                bool ok = false;
                ov.skip = parse_bool(val, ok);
                if (!ok)
                    throw std::runtime_error("Invalid skip value for submodule " + key + ": " + val);
            } else {
                throw std::runtime_error("Unknown setting '" + name + "' for submodule " + key);
            }
        }
        overrides[key] = ov;
    }
    return overrides;
}
