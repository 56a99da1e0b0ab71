#include "branch_negotiator.hpp"

#include "logger.hpp"

static bool remote_branch_exists(const fs::path& repo, const std::string& remote,
                                 const std::string& branch) {
    return git::reference_exists(repo, "refs/remotes/" + remote + "/" + branch);
}

std::optional<std::string> advertised_head_branch(const fs::path& repo, const std::string& remote,
                                                  const git::RemoteAuth* auth) {
    std::string err;
    auto head = git::get_remote_head_branch(repo, remote, auth, &err);
    if (head)
        return head;
    if (!err.empty())
        log_debug("Could not query HEAD of " + remote, err);
    return git::get_cached_remote_head(repo, remote);
}

std::string determine_working_branch(const fs::path& repo, const std::string& declared_branch,
                                     const git::RemoteAuth* auth) {
    if (!declared_branch.empty())
        return declared_branch;
    if (auto head = advertised_head_branch(repo, "origin", auth))
        return *head;
    if (auto current = git::get_current_branch(repo))
        return *current;
    return "main";
}

bool checkout_working_branch(const fs::path& repo, const std::string& branch,
                             std::string* error) {
    if (remote_branch_exists(repo, "origin", branch))
        return git::checkout_branch(repo, branch, "refs/remotes/origin/" + branch, error);
    log_debug("origin/" + branch + " does not exist; creating " + branch + " at HEAD");
    return git::checkout_branch(repo, branch, "", error);
}

std::string determine_upstream_branch(const fs::path& repo, const std::string& hint,
                                      const git::RemoteAuth* auth) {
    std::string err;
    if (auto head = git::get_remote_head_branch(repo, "upstream", auth, &err))
        return *head;
    if (!err.empty())
        log_debug("Could not query HEAD of upstream", err);
    if (!hint.empty())
        return hint;
    for (const char* name : {"main", "master"}) {
        if (remote_branch_exists(repo, "upstream", name))
            return name;
    }
    return "main";
}

std::optional<std::string> settle_upstream_branch(const fs::path& repo,
                                                  const std::string& candidate,
                                                  std::string* error) {
    if (remote_branch_exists(repo, "upstream", candidate))
        return candidate;
    log_warning("upstream/" + candidate + " not found after fetch; looking for candidates");
    for (const char* name : {"main", "master"}) {
        if (name != candidate && remote_branch_exists(repo, "upstream", name)) {
            log_warning(std::string("Falling back to upstream/") + name);
            return std::string(name);
        }
    }
    std::string list_err;
    auto branches = git::list_remote_branches(repo, "upstream", &list_err);
    if (!branches.empty()) {
        log_warning("Falling back to upstream/" + branches.front());
        return branches.front();
    }
    if (error) {
        *error = "upstream branch '" + candidate + "' not found and upstream has no branches";
        if (!list_err.empty())
            *error += ": " + list_err;
    }
    return std::nullopt;
}
