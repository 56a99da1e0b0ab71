#include "reconciler.hpp"

#include <utility>

#include "branch_negotiator.hpp"
#include "logger.hpp"

const char* reconcile_step_name(ReconcileStep step) {
    switch (step) {
    case ReconcileStep::NONE:
        return "none";
    case ReconcileStep::FETCH_ORIGIN:
        return "fetch origin";
    case ReconcileStep::CHECKOUT:
        return "checkout";
    case ReconcileStep::UPSTREAM_REMOTE:
        return "upstream remote";
    case ReconcileStep::FETCH_UPSTREAM:
        return "fetch upstream";
    case ReconcileStep::UPSTREAM_BRANCH:
        return "upstream branch";
    case ReconcileStep::MERGE:
        return "merge";
    case ReconcileStep::MEASURE:
        return "measure";
    }
    return "unknown";
}

std::string upstream_merge_message(const std::string& upstream_branch,
                                   const std::string& working_branch) {
    std::string msg = "Merge remote-tracking branch 'upstream/" + upstream_branch + "'";
    if (working_branch != "main" && working_branch != "master")
        msg += " into " + working_branch;
    return msg;
}

static bool fail(ReconciliationResult& res, ReconcileStep step, const std::string& error) {
    res.ok = false;
    res.failed_step = step;
    res.error = error;
    return false;
}

SubmoduleReconciler::SubmoduleReconciler(fs::path root, UpstreamResolver& resolver,
                                         git::RemoteAuth auth)
    : root_(std::move(root)), resolver_(resolver), auth_(std::move(auth)) {}

ReconciliationResult SubmoduleReconciler::reconcile(const SubmoduleSpec& spec) {
    LogGroup group("Processing submodule '" + spec.name + "' at '" + spec.path + "'");
    ReconciliationResult res;
    res.name = spec.name;
    res.path = spec.path;
    res.working_branch = spec.declared_branch;

    const fs::path dir = root_ / spec.path;
    if (spec.skip) {
        log_info("Skipping '" + spec.path + "' (disabled by configuration)");
        res.skipped = true;
        return res;
    }
    if (!git::is_git_repo(dir)) {
        log_info("Skipping '" + spec.path + "' (not initialized?)");
        res.skipped = true;
        return res;
    }

    std::string err;
    std::string pre_head = git::get_local_hash(dir, &err).value_or("");
    if (pre_head.empty())
        log_debug("No HEAD commit before reconciling " + spec.path, err);

    err.clear();
    auto origin_url = git::get_remote_url(dir, "origin", &err);
    if (!origin_url) {
        fail(res, ReconcileStep::FETCH_ORIGIN, err.empty() ? "no origin remote" : err);
        return res;
    }
    log_info("Origin URL: " + redact_url_credentials(*origin_url));
    if (!git::fetch_remote(dir, "origin", true, &auth_, &err)) {
        fail(res, ReconcileStep::FETCH_ORIGIN, err);
        return res;
    }

    res.working_branch = determine_working_branch(dir, spec.declared_branch, &auth_);
    log_info("Working with branch: " + res.working_branch);
    if (!checkout_working_branch(dir, res.working_branch, &err)) {
        fail(res, ReconcileStep::CHECKOUT, err);
        return res;
    }

    std::string upstream_hint;
    err.clear();
    auto existing = git::get_remote_url(dir, "upstream", &err);
    if (existing) {
        res.upstream_url = *existing;
        log_info("Using existing upstream: " + redact_url_credentials(res.upstream_url));
    } else if (!err.empty()) {
        fail(res, ReconcileStep::UPSTREAM_REMOTE, err);
        return res;
    } else {
        UpstreamDiscovery discovery = resolver_.resolve_upstream(*origin_url);
        if (discovery.status == DiscoveryStatus::FOUND && discovery.link) {
            if (!git::add_remote(dir, "upstream", discovery.link->url, &err)) {
                fail(res, ReconcileStep::UPSTREAM_REMOTE, err);
                return res;
            }
            res.upstream_url = discovery.link->url;
            upstream_hint = discovery.link->default_branch;
            log_info("Added upstream: " + redact_url_credentials(res.upstream_url));
        }
    }

    if (res.upstream_url.empty()) {
        log_info("No upstream configured; skipping merge for '" + spec.path + "'");
    } else if (!merge_upstream(dir, res, upstream_hint)) {
        return res;
    }

    measure(dir, pre_head, res);
    return res;
}

bool SubmoduleReconciler::merge_upstream(const fs::path& dir, ReconciliationResult& res,
                                         const std::string& upstream_hint) {
    std::string err;
    log_info("Fetching upstream (" + redact_url_credentials(res.upstream_url) + ")");
    if (!git::fetch_remote(dir, "upstream", true, &auth_, &err))
        return fail(res, ReconcileStep::FETCH_UPSTREAM, err);

    std::string candidate = determine_upstream_branch(dir, upstream_hint, &auth_);
    auto upstream_branch = settle_upstream_branch(dir, candidate, &err);
    if (!upstream_branch)
        return fail(res, ReconcileStep::UPSTREAM_BRANCH, err);

    const std::string upstream_ref = "upstream/" + *upstream_branch;
    log_info("Merging " + upstream_ref + " into " + res.working_branch);
    git::MergeResult merge = git::merge_ref(dir, "refs/remotes/" + upstream_ref,
                                            upstream_merge_message(*upstream_branch,
                                                                   res.working_branch));
    switch (merge.outcome) {
    case git::MergeOutcome::UP_TO_DATE:
        log_info("Already up to date with " + upstream_ref);
        return true;
    case git::MergeOutcome::FAST_FORWARD:
        log_info("Fast-forwarded " + res.working_branch + " to " + upstream_ref);
        return true;
    case git::MergeOutcome::MERGED:
        log_info("Merged " + upstream_ref + " into " + res.working_branch);
        return true;
    case git::MergeOutcome::CONFLICT: {
        std::string paths;
        for (const auto& p : merge.conflicts)
            paths += (paths.empty() ? "" : ", ") + p;
        return fail(res, ReconcileStep::MERGE,
                    "merge conflict in submodule '" + res.path + "' merging " + upstream_ref +
                        " into " + res.working_branch + "; resolve manually. Conflicting paths: " +
                        paths);
    }
    case git::MergeOutcome::FAILED:
        break;
    }
    return fail(res, ReconcileStep::MERGE,
                "merging " + upstream_ref + " into " + res.working_branch + " failed: " +
                    merge.error);
}

void SubmoduleReconciler::measure(const fs::path& dir, const std::string& pre_head,
                                  ReconciliationResult& res) {
    std::string err;
    const std::string origin_ref = "refs/remotes/origin/" + res.working_branch;
    if (git::reference_exists(dir, origin_ref)) {
        auto ahead = git::count_commits(dir, origin_ref, "HEAD", &err);
        if (!ahead) {
            fail(res, ReconcileStep::MEASURE, err);
            return;
        }
        auto files = git::diff_names(dir, origin_ref, "HEAD", &err);
        if (!files) {
            fail(res, ReconcileStep::MEASURE, err);
            return;
        }
        res.ahead_count = *ahead;
        res.changed_files = std::move(*files);
    }

    std::string post_head = git::get_local_hash(dir, &err).value_or("");
    res.had_head_change = !pre_head.empty() && !post_head.empty() && pre_head != post_head;
    if (res.had_head_change) {
        auto files = git::diff_names(dir, pre_head, post_head, &err);
        if (!files) {
            fail(res, ReconcileStep::MEASURE, err);
            return;
        }
        res.session_changed_files = std::move(*files);
    }
}
