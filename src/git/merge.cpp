#include "git_utils.hpp"
#include <algorithm>
#include "git/git_detail.hpp"

using namespace std;

namespace git {

static vector<string> collect_conflicts(git_index* idx) {
    vector<string> paths;
    git_index_conflict_iterator* raw = nullptr;
    if (git_index_conflict_iterator_new(&raw, idx) != 0)
        return paths;
    index_conflict_iterator_ptr it(raw);
    const git_index_entry* ancestor = nullptr;
    const git_index_entry* ours = nullptr;
    const git_index_entry* theirs = nullptr;
    while (git_index_conflict_next(&ancestor, &ours, &theirs, it.get()) == 0) {
        const git_index_entry* entry = ours ? ours : (theirs ? theirs : ancestor);
        if (entry && entry->path)
            paths.emplace_back(entry->path);
    }
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
    return paths;
}

/// Restore HEAD, index and working tree after a failed merge.
static void abort_merge(git_repository* r, git_commit* head) {
    git_checkout_options opts = GIT_CHECKOUT_OPTIONS_INIT;
    opts.checkout_strategy = GIT_CHECKOUT_FORCE;
    git_reset(r, reinterpret_cast<git_object*>(head), GIT_RESET_HARD, &opts);
    git_repository_state_cleanup(r);
}

static bool fast_forward(git_repository* r, const git_oid* target_oid, const string& refname,
                         string* error) {
    git_object* raw_target = nullptr;
    if (git_object_lookup(&raw_target, r, target_oid, GIT_OBJECT_COMMIT) != 0) {
        detail::set_error(error, "lookup " + refname);
        return false;
    }
    object_ptr target(raw_target);
    git_checkout_options opts = GIT_CHECKOUT_OPTIONS_INIT;
    opts.checkout_strategy = GIT_CHECKOUT_SAFE;
    if (git_checkout_tree(r, target.get(), &opts) != 0) {
        detail::set_error(error, "checkout " + refname);
        return false;
    }
    git_reference* raw_head = nullptr;
    if (git_repository_head(&raw_head, r) != 0) {
        detail::set_error(error, "read HEAD");
        return false;
    }
    reference_ptr head(raw_head);
    git_reference* raw_new = nullptr;
    if (git_reference_set_target(&raw_new, head.get(), target_oid,
                                 ("merge " + refname + ": Fast-forward").c_str()) != 0) {
        detail::set_error(error, "fast-forward to " + refname);
        return false;
    }
    reference_ptr moved(raw_new);
    return true;
}

MergeResult merge_ref(const fs::path& repo, const string& refname, const string& message) {
    MergeResult res;
    auto r = detail::open_repo(repo, &res.error);
    if (!r)
        return res;

    git_reference* raw_ref = nullptr;
    if (git_reference_lookup(&raw_ref, r->get(), refname.c_str()) != 0) {
        detail::set_error(&res.error, "lookup " + refname);
        return res;
    }
    reference_ptr their_ref(raw_ref);
    git_annotated_commit* raw_ac = nullptr;
    if (git_annotated_commit_from_ref(&raw_ac, r->get(), their_ref.get()) != 0) {
        detail::set_error(&res.error, "resolve " + refname);
        return res;
    }
    annotated_commit_ptr theirs(raw_ac);
    const git_annotated_commit* heads[] = {theirs.get()};

    git_merge_analysis_t analysis;
    git_merge_preference_t preference;
    if (git_merge_analysis(&analysis, &preference, r->get(), heads, 1) != 0) {
        detail::set_error(&res.error, "analyze merge of " + refname);
        return res;
    }
    if (analysis & GIT_MERGE_ANALYSIS_UP_TO_DATE) {
        res.outcome = MergeOutcome::UP_TO_DATE;
        return res;
    }
    if (analysis & GIT_MERGE_ANALYSIS_UNBORN) {
        res.error = "cannot merge " + refname + " into an unborn branch";
        return res;
    }
    const git_oid* their_oid = git_annotated_commit_id(theirs.get());
    if ((analysis & GIT_MERGE_ANALYSIS_FASTFORWARD) &&
        !(preference & GIT_MERGE_PREFERENCE_NO_FASTFORWARD)) {
        if (fast_forward(r->get(), their_oid, refname, &res.error))
            res.outcome = MergeOutcome::FAST_FORWARD;
        return res;
    }

    auto head = detail::resolve_commit(r->get(), "HEAD", &res.error);
    if (!head)
        return res;

    git_merge_options merge_opts = GIT_MERGE_OPTIONS_INIT;
    git_checkout_options checkout_opts = GIT_CHECKOUT_OPTIONS_INIT;
    checkout_opts.checkout_strategy = GIT_CHECKOUT_SAFE | GIT_CHECKOUT_ALLOW_CONFLICTS;
    if (git_merge(r->get(), heads, 1, &merge_opts, &checkout_opts) != 0) {
        detail::set_error(&res.error, "merge " + refname);
        abort_merge(r->get(), head->get());
        return res;
    }

    git_index* raw_idx = nullptr;
    if (git_repository_index(&raw_idx, r->get()) != 0) {
        detail::set_error(&res.error, "open index");
        abort_merge(r->get(), head->get());
        return res;
    }
    index_ptr idx(raw_idx);
    if (git_index_has_conflicts(idx.get())) {
        res.conflicts = collect_conflicts(idx.get());
        res.outcome = MergeOutcome::CONFLICT;
        res.error = "merge conflict with " + refname;
        abort_merge(r->get(), head->get());
        return res;
    }

    git_oid tree_oid;
    git_tree* raw_tree = nullptr;
    if (git_index_write_tree(&tree_oid, idx.get()) != 0 ||
        git_tree_lookup(&raw_tree, r->get(), &tree_oid) != 0) {
        detail::set_error(&res.error, "write merge tree");
        abort_merge(r->get(), head->get());
        return res;
    }
    tree_ptr tree(raw_tree);
    git_commit* raw_their_commit = nullptr;
    if (git_commit_lookup(&raw_their_commit, r->get(), their_oid) != 0) {
        detail::set_error(&res.error, "lookup " + refname);
        abort_merge(r->get(), head->get());
        return res;
    }
    commit_ptr their_commit(raw_their_commit);
    auto sig = detail::make_signature(r->get(), &res.error);
    if (!sig) {
        abort_merge(r->get(), head->get());
        return res;
    }
    git_oid merge_oid;
    if (git_commit_create_v(&merge_oid, r->get(), "HEAD", sig->get(), sig->get(), nullptr,
                            message.c_str(), tree.get(), 2, head->get(),
                            their_commit.get()) != 0) {
        detail::set_error(&res.error, "commit merge of " + refname);
        abort_merge(r->get(), head->get());
        return res;
    }
    git_repository_state_cleanup(r->get());
    res.outcome = MergeOutcome::MERGED;
    return res;
}

} // namespace git
