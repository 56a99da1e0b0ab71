#include "git_utils.hpp"
#include "git/git_detail.hpp"

using namespace std;

namespace git {

bool checkout_branch(const fs::path& repo, const string& branch, const string& start_point,
                     string* error) {
    auto r = detail::open_repo(repo, error);
    if (!r)
        return false;
    auto target = detail::resolve_commit(r->get(), start_point.empty() ? "HEAD" : start_point,
                                         error);
    if (!target)
        return false;

    git_checkout_options opts = GIT_CHECKOUT_OPTIONS_INIT;
    opts.checkout_strategy = GIT_CHECKOUT_FORCE;
    if (git_checkout_tree(r->get(), reinterpret_cast<git_object*>(target->get()), &opts) != 0) {
        detail::set_error(error, "checkout " + branch);
        return false;
    }

    const string refname = "refs/heads/" + branch;
    git_reference* existing_raw = nullptr;
    bool is_current = false;
    if (git_branch_lookup(&existing_raw, r->get(), branch.c_str(), GIT_BRANCH_LOCAL) == 0)
        is_current = git_branch_is_head(existing_raw) == 1;
    reference_ptr existing(existing_raw);

    // libgit2 refuses to force-create the branch HEAD points at, so move it
    // in place instead.
    git_reference* updated_raw = nullptr;
    int rc;
    if (is_current)
        rc = git_reference_set_target(&updated_raw, existing.get(), git_commit_id(target->get()),
                                      ("autosubsync: reset " + branch).c_str());
    else
        rc = git_branch_create(&updated_raw, r->get(), branch.c_str(), target->get(), 1);
    if (rc != 0) {
        detail::set_error(error, "create branch " + branch);
        return false;
    }
    reference_ptr updated(updated_raw);

    if (git_repository_set_head(r->get(), refname.c_str()) != 0) {
        detail::set_error(error, "switch HEAD to " + branch);
        return false;
    }

    const string remote_prefix = "refs/remotes/";
    if (start_point.rfind(remote_prefix, 0) == 0) {
        string upstream = start_point.substr(remote_prefix.size());
        if (git_branch_set_upstream(updated.get(), upstream.c_str()) != 0) {
            detail::set_error(error, "set upstream of " + branch + " to " + upstream);
            return false;
        }
    }
    return true;
}

} // namespace git
