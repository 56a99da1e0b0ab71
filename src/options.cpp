#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

// Config file loading, environment lookup and per-submodule overrides are
// defined in src/options/config.cpp.

static const std::set<std::string> VALUE_FLAGS{"--root",
                                               "--config-yaml",
                                               "--config-json",
                                               "--log-file",
                                               "--log-level",
                                               "--max-log-size",
                                               "--automation-branch",
                                               "--github-repository",
                                               "--http-timeout",
                                               "--network-timeout",
                                               "--ssh-private-key",
                                               "--ssh-public-key",
                                               "--credential-file"};

static const std::set<std::string> SWITCH_FLAGS{"--dry-run",      "--no-push", "--verbose",
                                                "--json-log",     "--syslog",  "--compress-logs",
                                                "--silent",       "--github-actions",
                                                "--no-notify",    "--help",    "--version"};

static const std::map<char, std::string> SHORT_FLAGS{{'y', "--config-yaml"},
                                                     {'j', "--config-json"},
                                                     {'h', "--help"},
                                                     {'v', "--version"}};

static LogLevel parse_log_level(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (v == "DEBUG")
        return LogLevel::DEBUG;
    if (v == "INFO")
        return LogLevel::INFO;
    if (v == "WARNING" || v == "WARN")
        return LogLevel::WARNING;
    if (v == "ERROR" || v == "ERR")
        return LogLevel::ERR;
    throw std::runtime_error("Invalid value for --log-level: " + value);
}

Options parse_options(int argc, char* argv[]) {
    std::set<std::string> known = VALUE_FLAGS;
    known.insert(SWITCH_FLAGS.begin(), SWITCH_FLAGS.end());
    ArgParser parser(argc, argv, known, SHORT_FLAGS, VALUE_FLAGS);

    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");
    if (parser.positional().size() > 1)
        throw std::runtime_error("Unexpected argument: " + parser.positional()[1]);

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    if (opts.show_help || opts.print_version)
        return opts;

    ConfigOptions cfg_opts;
    SubmoduleConfigs submodule_opts;
    opts.config_file = load_config_file(parser, cfg_opts, submodule_opts);
    for (const auto& [key, val] : cfg_opts) {
        if (!known.count(key) || key == "--config-yaml" || key == "--config-json" ||
            key == "--help" || key == "--version")
            throw std::runtime_error("Unknown config option: " + key.substr(2));
    }
    opts.env = read_environment();

    auto cfg_opt = [&](const std::string& k) -> std::string {
        auto it = cfg_opts.find(k);
        return it == cfg_opts.end() ? std::string() : it->second;
    };
    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        bool ok = false;
        bool v = parse_bool(it->second, ok);
        if (!ok)
            throw std::runtime_error("Invalid boolean for " + k + ": " + it->second);
        return v;
    };
    auto flag = [&](const std::string& k) { return parser.has_flag(k) || cfg_flag(k); };
    auto has_value = [&](const std::string& k) {
        return parser.has_flag(k) || cfg_opts.count(k) > 0;
    };
    auto value = [&](const std::string& k) {
        return parser.has_flag(k) ? parser.get_option(k) : cfg_opt(k);
    };

    if (parser.has_flag("--root"))
        opts.root = parser.get_option("--root");
    else if (!parser.positional().empty())
        opts.root = parser.positional().front();
    else if (cfg_opts.count("--root"))
        opts.root = cfg_opt("--root");
    else
        opts.root = fs::current_path();
    if (opts.root.empty())
        throw std::runtime_error("--root requires a path");

    opts.dry_run = flag("--dry-run") || flag("--no-push");
    opts.notify = !flag("--no-notify");

    LoggingOptions& log = opts.logging;
    log.silent = flag("--silent");
    log.json_log = flag("--json-log");
    log.compress_logs = flag("--compress-logs");
    log.use_syslog = flag("--syslog");
    log.github_actions = flag("--github-actions");
    if (!log.github_actions) {
        const char* gha = std::getenv("GITHUB_ACTIONS");
        log.github_actions = gha && std::string(gha) == "true";
    }
    if (has_value("--log-file"))
        log.log_file = value("--log-file");
    if (has_value("--log-level"))
        log.log_level = parse_log_level(value("--log-level"));
    if (flag("--verbose"))
        log.log_level = LogLevel::DEBUG;
    if (has_value("--max-log-size")) {
        bool ok = false;
        log.max_log_size = parse_bytes(value("--max-log-size"), 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }

    if (has_value("--automation-branch")) {
        opts.automation_branch = value("--automation-branch");
        if (opts.automation_branch.empty())
            throw std::runtime_error("--automation-branch cannot be empty");
    }
    opts.github_repository =
        has_value("--github-repository") ? value("--github-repository") : opts.env.github_repository;
    if (has_value("--http-timeout")) {
        bool ok = false;
        opts.http_timeout = parse_long(value("--http-timeout"), 1, 3600, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --http-timeout");
    }
    if (has_value("--network-timeout")) {
        bool ok = false;
        opts.network_timeout =
            static_cast<unsigned int>(parse_long(value("--network-timeout"), 0, 86400, ok));
        if (!ok)
            throw std::runtime_error("Invalid value for --network-timeout");
    }

    if (has_value("--ssh-public-key"))
        opts.auth.ssh_public_key = value("--ssh-public-key");
    if (has_value("--ssh-private-key"))
        opts.auth.ssh_private_key = value("--ssh-private-key");
    if (has_value("--credential-file"))
        opts.auth.credential_file = value("--credential-file");
    if (!opts.auth.ssh_private_key.empty() && !fs::exists(opts.auth.ssh_private_key))
        throw std::runtime_error("SSH private key not found: " +
                                 opts.auth.ssh_private_key.string());

    opts.submodule_overrides = parse_submodule_overrides(submodule_opts);
    return opts;
}

HostingConfig hosting_config(const Options& opts) {
    HostingConfig cfg;
    cfg.github_api = opts.env.github_api;
    cfg.github_token = opts.env.github_token;
    cfg.gitlab_api = opts.env.gitlab_api;
    cfg.gitlab_token = opts.env.gitlab_token;
    return cfg;
}

PublishConfig publish_config(const Options& opts) {
    PublishConfig cfg;
    cfg.root = opts.root;
    cfg.automation_branch = opts.automation_branch;
    cfg.github_repository = opts.github_repository;
    cfg.github_output = opts.env.github_output;
    cfg.dry_run = opts.dry_run;
    cfg.notify = opts.notify;
    cfg.auth = opts.auth;
    return cfg;
}

ForumConfig forum_config(const Options& opts) {
    ForumConfig cfg;
    cfg.base_url = opts.env.forum_base_url;
    cfg.api_key = opts.env.forum_api_key;
    cfg.api_user = opts.env.forum_api_user;
    cfg.thread_id = opts.env.forum_thread_id;
    return cfg;
}
