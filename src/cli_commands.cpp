#include "cli_commands.hpp"

#include <string>
#include <vector>

#include "fleet.hpp"
#include "forum_notifier.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "publisher.hpp"
#include "reconciler.hpp"
#include "submodule.hpp"
#include "upstream_resolver.hpp"
#include "version.hpp"

namespace cli {

void setup_logging(const Options& opts) {
    const LoggingOptions& log = opts.logging;
    set_log_level(log.log_level);
    set_console_logging(!log.silent);
    set_github_annotations(log.github_actions);
    if (!log.log_file.empty()) {
        init_logger(log.log_file, log.log_level, log.max_log_size);
        set_json_logging(log.json_log);
        set_log_compression(log.compress_logs);
    }
    if (log.use_syslog)
        init_syslog();
}

int run_sync(const Options& opts, HttpClient& http) {
    log_info(std::string("autosubsync ") + AUTOSUBSYNC_VERSION + " starting",
             {{"root", opts.root.string()},
              {"dry_run", std::string(opts.dry_run ? "true" : "false")}});
    if (!opts.config_file.empty())
        log_debug("Loaded config", opts.config_file.string());
    if (!git::is_git_repo(opts.root)) {
        log_error("Not a git repository", opts.root.string());
        return 1;
    }
    std::string err;
    auto specs = read_manifest(opts.root, &err);
    if (!specs) {
        log_error("Cannot read submodule manifest", err);
        return 1;
    }
    apply_submodule_overrides(*specs, opts.submodule_overrides);
    if (opts.network_timeout > 0)
        git::set_libgit_timeout(opts.network_timeout);

    HostingUpstreamResolver resolver(hosting_config(opts), http);
    SubmoduleReconciler reconciler(opts.root, resolver, opts.auth);
    ForumNotifier forum(forum_config(opts), http);
    PublicationManager publisher(publish_config(opts), hosting_config(opts), http, &forum);

    FleetConfig fleet_cfg;
    fleet_cfg.root = opts.root;
    fleet_cfg.dry_run = opts.dry_run;
    fleet_cfg.auth = opts.auth;
    Fleet fleet(fleet_cfg, reconciler, publisher);
    bool ok = fleet.run(*specs);
    if (ok)
        log_info("Done.");
    return ok ? 0 : 1;
}

int handle_sync_run(const Options& opts) {
    CurlHttpClient http(opts.http_timeout);
    return run_sync(opts, http);
}

} // namespace cli
