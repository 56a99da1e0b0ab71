#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

#include "config_utils.hpp"
#include "forum_notifier.hpp"
#include "git_utils.hpp"
#include "hosting.hpp"
#include "logger.hpp"
#include "publisher.hpp"
#include "submodule.hpp"

namespace fs = std::filesystem;

struct LoggingOptions {
    std::string log_file;
    LogLevel log_level = LogLevel::INFO;
    size_t max_log_size = 0;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
    bool silent = false;
    bool github_actions = false; ///< Emit workflow command annotations
};

/**
 * @brief Values read from the process environment.
 *
 * Secrets are only ever taken from here, never from flags or config files.
 */
struct EnvironmentOptions {
    std::string github_api = "https://api.github.com";
    std::string github_token;
    std::string gitlab_api = "https://gitlab.com/api/v4";
    std::string gitlab_token;
    std::string forum_base_url = "https://www.redguides.com/community/api";
    std::string forum_api_key;
    std::string forum_api_user = "7384";
    long forum_thread_id = 95078;
    std::string github_repository;
    std::string github_output;
};

struct Options {
    fs::path root;
    bool dry_run = false;
    bool notify = true;
    bool show_help = false;
    bool print_version = false;
    std::string automation_branch = "auto/submodule-updates";
    std::string github_repository;
    long http_timeout = 30;
    unsigned int network_timeout = 0; ///< Seconds; `0` keeps the libgit2 default
    fs::path config_file;
    LoggingOptions logging;
    git::RemoteAuth auth;
    EnvironmentOptions env;
    std::map<std::string, SubmoduleOverride> submodule_overrides;
};

/**
 * @brief Parse command-line arguments, configuration files and the
 * environment into an Options instance.
 *
 * Command-line values win over config file values, which win over
 * environment values, which win over defaults.
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Fully populated Options structure.
 * @throws std::runtime_error on unknown flags, invalid values or an
 *         unreadable config file.
 */
Options parse_options(int argc, char* argv[]);

/**
 * @brief Read the environment variables consumed by autosubsync.
 *
 * An invalid `XF_THREAD_ID` keeps the default thread.
 */
EnvironmentOptions read_environment();

class ArgParser;

/**
 * @brief Load the file named by `--config-yaml` or `--config-json`.
 *
 * @param parser         Parsed command line.
 * @param cfg_opts       Receives top-level option values.
 * @param submodule_opts Receives per-submodule settings.
 * @return The loaded file, or an empty path when none was requested.
 * @throws std::runtime_error when the file cannot be loaded.
 */
fs::path load_config_file(const ArgParser& parser, ConfigOptions& cfg_opts,
                          SubmoduleConfigs& submodule_opts);

/**
 * @brief Convert per-submodule config entries into overrides.
 *
 * @throws std::runtime_error on an invalid `skip` value.
 */
std::map<std::string, SubmoduleOverride> parse_submodule_overrides(
    const SubmoduleConfigs& submodule_opts);

HostingConfig hosting_config(const Options& opts);
PublishConfig publish_config(const Options& opts);
ForumConfig forum_config(const Options& opts);

#endif // OPTIONS_HPP
