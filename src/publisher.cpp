#include "publisher.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <utility>

#include "branch_negotiator.hpp"
#include "logger.hpp"

const char* publish_state_name(PublishState state) {
    switch (state) {
    case PublishState::IDLE:
        return "idle";
    case PublishState::CHECKOUT_BASE:
        return "checkout base";
    case PublishState::CHECKOUT_AUTOMATION_BRANCH:
        return "checkout automation branch";
    case PublishState::STAGE_PATHS:
        return "stage paths";
    case PublishState::COMMIT:
        return "commit";
    case PublishState::PUSH:
        return "push";
    case PublishState::PULL_REQUEST:
        return "pull request";
    case PublishState::NOTIFY:
        return "notify";
    case PublishState::DONE:
        return "done";
    case PublishState::FAILED:
        return "failed";
    }
    return "unknown";
}

std::string publish_commit_body(const std::vector<std::string>& paths) {
    std::string body = "Automated update of submodule references.\n\nUpdated paths:";
    for (const auto& p : paths)
        body += "\n- " + p;
    return body;
}

PublicationManager::PublicationManager(PublishConfig config, HostingConfig hosting,
                                       HttpClient& http, const ForumNotifier* forum)
    : config_(std::move(config)), hosting_(std::move(hosting)), http_(http), forum_(forum) {}

bool PublicationManager::fail(const std::string& message) {
    log_error("Publishing failed at " + std::string(publish_state_name(state_)) + ": " + message);
    state_ = PublishState::FAILED;
    return false;
}

bool PublicationManager::publish(const std::vector<ReconciliationResult>& updated_modules) {
    LogGroup group("Publishing submodule pointer updates");
    pr_url_.clear();
    pr_created_ = false;
    base_branch_.clear();

    state_ = PublishState::CHECKOUT_BASE;
    if (!checkout_base())
        return false;

    state_ = PublishState::CHECKOUT_AUTOMATION_BRANCH;
    if (!checkout_automation_branch())
        return false;

    state_ = PublishState::STAGE_PATHS;
    std::set<std::string> unique;
    for (const auto& r : updated_modules) {
        if (!r.path.empty())
            unique.insert(r.path);
    }
    std::vector<std::string> paths(unique.begin(), unique.end());
    if (paths.empty()) {
        log_info("No submodule paths detected to stage in superproject.");
        state_ = PublishState::DONE;
        return true;
    }
    bool committed = false;
    if (!stage_and_commit(paths, committed))
        return false;
    if (!committed) {
        state_ = PublishState::DONE;
        return true;
    }

    if (config_.dry_run) {
        log_info("Dry run: would push to rolling branch '" + config_.automation_branch +
                 "' and open or update PR -> base '" + base_branch_ + "'.");
        if (config_.notify && forum_)
            log_info("Dry run: would post to forum thread " +
                     std::to_string(forum_->config().thread_id) + " if a new PR is opened.");
        state_ = PublishState::DONE;
        return true;
    }

    state_ = PublishState::PUSH;
    if (!push())
        return false;

    state_ = PublishState::PULL_REQUEST;
    open_pull_request(PUBLISH_COMMIT_TITLE, publish_commit_body(paths));
    state_ = PublishState::DONE;
    return true;
}

bool PublicationManager::checkout_base() {
    std::string err;
    if (!git::fetch_remote(config_.root, "origin", true, &config_.auth, &err))
        log_warning("Could not fetch superproject origin", err);
    base_branch_ = advertised_head_branch(config_.root, "origin", &config_.auth).value_or("main");
    log_info("Base branch: " + base_branch_);
    const std::string origin_base = "refs/remotes/origin/" + base_branch_;
    if (git::reference_exists(config_.root, origin_base)) {
        if (!git::checkout_branch(config_.root, base_branch_, origin_base, &err))
            return fail(err);
    } else if (git::reference_exists(config_.root, "refs/heads/" + base_branch_)) {
        log_warning("origin/" + base_branch_ + " not found; using local " + base_branch_);
        if (!git::checkout_branch(config_.root, base_branch_, "refs/heads/" + base_branch_, &err))
            return fail(err);
    } else {
        log_warning("Base branch " + base_branch_ + " not found; staying on current HEAD");
    }
    return true;
}

bool PublicationManager::checkout_automation_branch() {
    std::string err;
    const std::string& branch = config_.automation_branch;
    const std::string remote_branch = "refs/remotes/origin/" + branch;
    const std::string remote_base = "refs/remotes/origin/" + base_branch_;
    std::string start;
    if (git::reference_exists(config_.root, remote_branch))
        start = remote_branch;
    else if (git::reference_exists(config_.root, remote_base))
        start = remote_base;
    log_info("Switching to " + branch + (start.empty() ? " at HEAD" : " from " + start));
    if (!git::checkout_branch(config_.root, branch, start, &err))
        return fail("cannot switch to " + branch + ": " + err);
    return true;
}

bool PublicationManager::stage_and_commit(const std::vector<std::string>& paths,
                                          bool& committed) {
    std::string err;
    for (const auto& p : paths) {
        log_info("Staging " + p);
        if (!git::stage_submodule(config_.root, p, &err))
            return fail(err);
    }

    state_ = PublishState::COMMIT;
    auto dirty = git::index_differs_from_head(config_.root, &err);
    if (!dirty)
        return fail(err);
    if (!*dirty) {
        log_info("Superproject has no changes to commit; skipping commit/PR.");
        committed = false;
        return true;
    }
    std::string message = std::string(PUBLISH_COMMIT_TITLE) + "\n\n" + publish_commit_body(paths);
    auto commit = git::commit_index(config_.root, message, &err);
    if (!commit)
        return fail(err);
    log_info("Committed " + commit->substr(0, 12) + " on " + config_.automation_branch);
    committed = true;
    return true;
}

bool PublicationManager::push() {
    std::string err;
    const std::string& branch = config_.automation_branch;
    log_info("Pushing " + branch + " to origin");
    if (!git::push_branch(config_.root, "origin", branch, branch, &config_.auth, &err))
        return fail("failed to push branch '" + branch + "': " + err);
    return true;
}

void PublicationManager::open_pull_request(const std::string& title, const std::string& body) {
    std::string full_name;
    std::string err;
    if (auto origin_url = git::get_remote_url(config_.root, "origin", &err)) {
        RemoteDescriptor origin = parse_remote_url(*origin_url);
        if (origin.provider == HostingKind::GITHUB)
            full_name = origin.full_name();
    } else if (!err.empty()) {
        log_warning("Cannot read superproject origin URL", err);
        err.clear();
    }
    if (full_name.empty())
        full_name = config_.github_repository;
    if (full_name.find('/') == std::string::npos) {
        log_info("Origin is not a GitHub URL and no GitHub repository is configured; "
                 "skipping PR creation.");
        return;
    }
    if (hosting_.github_token.empty()) {
        log_warning("GH_API_TOKEN not set; cannot open a GitHub PR for " + full_name + ".");
        return;
    }

    GitHubProvider github(hosting_.github_api, hosting_.github_token, http_);
    auto existing =
        github.find_pull_request(full_name, config_.automation_branch, base_branch_, &err);
    if (existing) {
        pr_url_ = *existing;
        log_info("Updated existing PR: " + pr_url_);
        return;
    }
    if (!err.empty()) {
        log_error("Could not list pull requests of " + full_name, err);
        return;
    }
    auto created = github.create_pull_request(full_name, config_.automation_branch, base_branch_,
                                              title, body, &err);
    if (!created) {
        log_error("Failed to open PR via GitHub API", err);
        return;
    }
    pr_url_ = *created;
    pr_created_ = true;
    log_info("Opened PR: " + pr_url_);
    write_github_output(full_name);

    if (config_.notify && forum_) {
        state_ = PublishState::NOTIFY;
        std::string message =
            "Hi I'm from autosubsync. I need a human to review this automated pull request: " +
            pr_url_;
        if (!forum_->notify(message))
            log_warning("Forum was not notified about " + pr_url_);
    }
}

void PublicationManager::write_github_output(const std::string& full_name) const {
    if (config_.github_output.empty())
        return;
    std::ofstream out(config_.github_output, std::ios::app);
    if (!out) {
        log_warning("Cannot write GitHub output file", config_.github_output);
        return;
    }
    out << "new_pr_created=true\n";
    out << "pr_url=" << pr_url_ << "\n";
    out << "repo_url=https://github.com/" << full_name << "\n";
}
