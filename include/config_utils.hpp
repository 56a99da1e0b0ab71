#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/// Option values keyed by long flag, e.g. `--automation-branch`.
using ConfigOptions = std::map<std::string, std::string>;

/// Per-submodule settings keyed by submodule name or path.
using SubmoduleConfigs = std::map<std::string, std::map<std::string, std::string>>;

/**
 * @brief Load configuration options from a YAML file.
 *
 * Top-level scalars become `--key` entries of @p opts. The `submodules` map
 * fills @p submodule_opts with its nested scalars, e.g. `branch` and `skip`.
 * Nested maps under any other key are flattened into @p opts.
 *
 * @param path           Filesystem path to the YAML configuration file.
 * @param opts           Map receiving global option values.
 * @param submodule_opts Map receiving per-submodule settings.
 * @param error          Receives a human-readable message on failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_yaml_config(const std::string& path, ConfigOptions& opts,
                      SubmoduleConfigs& submodule_opts, std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Accepts the same layout as load_yaml_config().
 */
bool load_json_config(const std::string& path, ConfigOptions& opts,
                      SubmoduleConfigs& submodule_opts, std::string& error);

#endif // CONFIG_UTILS_HPP
