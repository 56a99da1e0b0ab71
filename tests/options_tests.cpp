#include "test_common.hpp"
#include "config_utils.hpp"
#include "help_text.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include <cstdint>
#include <sstream>
#include <stdexcept>

using namespace autosubsync::test_support;

static void clear_env() {
    for (const char* name :
         {"GH_API", "GH_API_TOKEN", "GL_API", "GITLAB_API_TOKEN", "XF_BASE_URL",
          "XF_DONOTREPLY_KEY", "XF_API_USER", "XF_THREAD_ID", "GITHUB_REPOSITORY", "GITHUB_OUTPUT",
          "GITHUB_ACTIONS"})
        unsetenv(name);
}

template <size_t N> static Options parse(const char* (&argv)[N]) {
    return parse_options(static_cast<int>(N), const_cast<char**>(argv));
}

TEST_CASE("parse_options defaults") {
    clear_env();
    const char* argv[] = {"autosubsync"};
    Options opts = parse(argv);
    REQUIRE(opts.root == fs::current_path());
    REQUIRE_FALSE(opts.dry_run);
    REQUIRE(opts.notify);
    REQUIRE(opts.automation_branch == "auto/submodule-updates");
    REQUIRE(opts.http_timeout == 30);
    REQUIRE(opts.network_timeout == 0);
    REQUIRE(opts.logging.log_level == LogLevel::INFO);
    REQUIRE_FALSE(opts.logging.github_actions);
    REQUIRE(opts.env.github_api == "https://api.github.com");
    REQUIRE(opts.env.gitlab_api == "https://gitlab.com/api/v4");
    REQUIRE(opts.env.forum_base_url == "https://www.redguides.com/community/api");
    REQUIRE(opts.env.forum_api_user == "7384");
    REQUIRE(opts.env.forum_thread_id == 95078);
    REQUIRE(opts.submodule_overrides.empty());
}

TEST_CASE("parse_options command line flags") {
    clear_env();
    const char* argv[] = {"autosubsync",         "/srv/super", "--no-push",
                          "--automation-branch", "bot/subs",   "--http-timeout=5",
                          "--verbose",           "--no-notify", "--github-actions"};
    Options opts = parse(argv);
    REQUIRE(opts.root == fs::path("/srv/super"));
    REQUIRE(opts.dry_run);
    REQUIRE_FALSE(opts.notify);
    REQUIRE(opts.automation_branch == "bot/subs");
    REQUIRE(opts.http_timeout == 5);
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    REQUIRE(opts.logging.github_actions);
}

TEST_CASE("parse_options rejects bad input") {
    clear_env();
    const char* unknown[] = {"autosubsync", "--frobnicate"};
    REQUIRE_THROWS_AS(parse(unknown), std::runtime_error);
    const char* timeout[] = {"autosubsync", "--http-timeout", "soon"};
    REQUIRE_THROWS_AS(parse(timeout), std::runtime_error);
    const char* level[] = {"autosubsync", "--log-level", "LOUD"};
    REQUIRE_THROWS_AS(parse(level), std::runtime_error);
    const char* missing[] = {"autosubsync", "--root"};
    REQUIRE_THROWS_AS(parse(missing), std::runtime_error);
    const char* config[] = {"autosubsync", "--config-yaml", "/nonexistent/autosubsync.yaml"};
    REQUIRE_THROWS_AS(parse(config), std::runtime_error);
}

TEST_CASE("parse_options help and version short circuit") {
    clear_env();
    const char* help[] = {"autosubsync", "-h"};
    REQUIRE(parse(help).show_help);
    const char* version[] = {"autosubsync", "--version"};
    REQUIRE(parse(version).print_version);
}

TEST_CASE("parse_options reads the environment") {
    clear_env();
    setenv("GH_API_TOKEN", "ghtoken", 1);
    setenv("GITLAB_API_TOKEN", "gltoken", 1);
    setenv("GH_API", "https://ghe.example.com/api/v3", 1);
    setenv("XF_DONOTREPLY_KEY", "forumkey", 1);
    setenv("XF_THREAD_ID", "1234", 1);
    setenv("GITHUB_REPOSITORY", "acme/super", 1);
    setenv("GITHUB_OUTPUT", "/tmp/gh_output", 1);
    setenv("GITHUB_ACTIONS", "true", 1);
    const char* argv[] = {"autosubsync"};
    Options opts = parse(argv);
    HostingConfig hosting = hosting_config(opts);
    REQUIRE(hosting.github_token == "ghtoken");
    REQUIRE(hosting.gitlab_token == "gltoken");
    REQUIRE(hosting.github_api == "https://ghe.example.com/api/v3");
    ForumConfig forum = forum_config(opts);
    REQUIRE(forum.api_key == "forumkey");
    REQUIRE(forum.thread_id == 1234);
    REQUIRE(forum.complete());
    PublishConfig publish = publish_config(opts);
    REQUIRE(publish.github_repository == "acme/super");
    REQUIRE(publish.github_output == "/tmp/gh_output");
    REQUIRE(opts.logging.github_actions);
    clear_env();
}

TEST_CASE("invalid XF_THREAD_ID keeps the default thread") {
    clear_env();
    setenv("XF_THREAD_ID", "not-a-number", 1);
    REQUIRE(read_environment().forum_thread_id == 95078);
    setenv("XF_THREAD_ID", "-4", 1);
    REQUIRE(read_environment().forum_thread_id == 95078);
    clear_env();
}

TEST_CASE("config file values sit between command line and environment") {
    clear_env();
    TempDir dir("options_yaml");
    fs::path cfg = dir / "autosubsync.yaml";
    write_file(cfg, "automation-branch: cfg/branch\n"
                    "github-repository: cfg/repo\n"
                    "dry-run: true\n"
                    "log-level: WARNING\n"
                    "submodules:\n"
                    "  docs:\n"
                    "    branch: develop\n"
                    "  vendor/legacy:\n"
                    "    skip: yes\n");
    setenv("GITHUB_REPOSITORY", "env/repo", 1);
    std::string cfg_path = cfg.string();
    const char* argv[] = {"autosubsync", "-y", cfg_path.c_str(), "--automation-branch", "cli/branch"};
    Options opts = parse(argv);
    REQUIRE(opts.config_file == cfg);
    REQUIRE(opts.automation_branch == "cli/branch");
    REQUIRE(opts.github_repository == "cfg/repo");
    REQUIRE(opts.dry_run);
    REQUIRE(opts.logging.log_level == LogLevel::WARNING);
    REQUIRE(opts.submodule_overrides.size() == 2);
    REQUIRE(opts.submodule_overrides.at("docs").branch == std::optional<std::string>("develop"));
    REQUIRE_FALSE(opts.submodule_overrides.at("docs").skip);
    REQUIRE(opts.submodule_overrides.at("vendor/legacy").skip);
    clear_env();
}

TEST_CASE("unknown config keys are rejected") {
    clear_env();
    TempDir dir("options_bad_key");
    fs::path cfg = dir / "autosubsync.json";
    write_file(cfg, R"({"interval": 30})");
    std::string cfg_path = cfg.string();
    const char* argv[] = {"autosubsync", "--config-json", cfg_path.c_str()};
    REQUIRE_THROWS_AS(parse(argv), std::runtime_error);
}

TEST_CASE("load_json_config reads options and submodules") {
    TempDir dir("config_json");
    fs::path cfg = dir / "cfg.json";
    write_file(cfg, R"({"root": "/srv/super", "http-timeout": 12, "silent": true,
                        "logging": {"json-log": false},
                        "submodules": {"libs/core": {"branch": "stable", "skip": false}}})");
    ConfigOptions opts;
    SubmoduleConfigs subs;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, subs, err));
    REQUIRE(opts["--root"] == "/srv/super");
    REQUIRE(opts["--http-timeout"] == "12");
    REQUIRE(opts["--silent"] == "true");
    REQUIRE(opts["--json-log"] == "false");
    REQUIRE(subs["libs/core"]["branch"] == "stable");
    REQUIRE(subs["libs/core"]["skip"] == "false");
}

TEST_CASE("load_yaml_config reports malformed files") {
    TempDir dir("config_yaml_bad");
    fs::path cfg = dir / "cfg.yaml";
    write_file(cfg, "- just\n- a\n- list\n");
    ConfigOptions opts;
    SubmoduleConfigs subs;
    std::string err;
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, subs, err));
    REQUIRE_FALSE(err.empty());

    write_file(cfg, "submodules: [a, b]\n");
    err.clear();
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, subs, err));
    REQUIRE(err.find("submodules") != std::string::npos);

    err.clear();
    REQUIRE_FALSE(load_yaml_config((dir / "missing.yaml").string(), opts, subs, err));
    REQUIRE(err == "Failed to open file");
}

TEST_CASE("config loaders reject values of the wrong shape") {
    TempDir dir("config_shapes");
    fs::path yaml = dir / "cfg.yaml";
    fs::path json = dir / "cfg.json";
    ConfigOptions opts;
    SubmoduleConfigs subs;
    std::string err;

    write_file(yaml, "submodules:\n  libs/a: skip\n");
    REQUIRE_FALSE(load_yaml_config(yaml.string(), opts, subs, err));
    REQUIRE(err.find("libs/a") != std::string::npos);

    write_file(yaml, "automation-branch: [a, b]\n");
    err.clear();
    REQUIRE_FALSE(load_yaml_config(yaml.string(), opts, subs, err));
    REQUIRE(err.find("automation-branch") != std::string::npos);

    write_file(yaml, "submodules:\n  libs/a:\n    branch: [x]\n");
    err.clear();
    REQUIRE_FALSE(load_yaml_config(yaml.string(), opts, subs, err));
    REQUIRE(err.find("branch") != std::string::npos);

    write_file(yaml, "submodules:\n  libs/a:\n");
    err.clear();
    subs.clear();
    REQUIRE(load_yaml_config(yaml.string(), opts, subs, err));
    REQUIRE(subs.count("libs/a") == 1);

    write_file(json, R"({"submodules": {"libs/a": "skip"}})");
    err.clear();
    REQUIRE_FALSE(load_json_config(json.string(), opts, subs, err));
    REQUIRE(err.find("libs/a") != std::string::npos);

    write_file(json, R"({"github-repository": ["a", "b"]})");
    err.clear();
    REQUIRE_FALSE(load_json_config(json.string(), opts, subs, err));
    REQUIRE(err.find("github-repository") != std::string::npos);

    clear_env();
    write_file(yaml, "submodules:\n  libs/a: skip\n");
    std::string cfg_path = yaml.string();
    const char* argv[] = {"autosubsync", "-y", cfg_path.c_str()};
    REQUIRE_THROWS_AS(parse(argv), std::runtime_error);
}

TEST_CASE("parse_submodule_overrides validates settings") {
    SubmoduleConfigs subs;
    subs["docs"]["skip"] = "maybe";
    REQUIRE_THROWS_AS(parse_submodule_overrides(subs), std::runtime_error);
    subs.clear();
    subs["docs"]["colour"] = "blue";
    REQUIRE_THROWS_AS(parse_submodule_overrides(subs), std::runtime_error);
}

TEST_CASE("parse utilities") {
    bool ok = false;
    REQUIRE(parse_long("42", 0, 100, ok) == 42);
    REQUIRE(ok);
    parse_long("42x", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_long("101", 0, 100, ok);
    REQUIRE_FALSE(ok);

    REQUIRE(parse_bool("Yes", ok));
    REQUIRE(ok);
    REQUIRE_FALSE(parse_bool("off", ok));
    REQUIRE(ok);
    parse_bool("sometimes", ok);
    REQUIRE_FALSE(ok);

    REQUIRE(parse_bytes("2KB", 0, SIZE_MAX, ok) == 2048);
    REQUIRE(ok);
    REQUIRE(parse_bytes("1mb", 0, SIZE_MAX, ok) == 1024 * 1024);
    REQUIRE(parse_bytes("512", 0, SIZE_MAX, ok) == 512);
    parse_bytes("12 parsecs", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("help text lists every flag group") {
    std::ostringstream out;
    print_help("autosubsync", out);
    std::string text = out.str();
    REQUIRE(text.find("Usage: autosubsync") != std::string::npos);
    for (const char* flag : {"--dry-run", "--no-push", "--config-yaml", "--automation-branch",
                             "--github-actions", "--no-notify", "--ssh-private-key"})
        REQUIRE(text.find(flag) != std::string::npos);
}
