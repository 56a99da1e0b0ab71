#include "git_utils.hpp"
#include "git/git_detail.hpp"

using namespace std;

namespace git {

optional<size_t> count_commits(const fs::path& repo, const string& from, const string& to,
                               string* error) {
    auto r = detail::open_repo(repo, error);
    if (!r)
        return nullopt;
    git_revwalk* raw = nullptr;
    if (git_revwalk_new(&raw, r->get()) != 0) {
        detail::set_error(error, "create revwalk");
        return nullopt;
    }
    revwalk_ptr walk(raw);
    string range = from + ".." + to;
    if (git_revwalk_push_range(walk.get(), range.c_str()) != 0) {
        detail::set_error(error, "walk " + range);
        return nullopt;
    }
    size_t count = 0;
    git_oid oid;
    while (git_revwalk_next(&oid, walk.get()) == 0)
        ++count;
    return count;
}

optional<vector<string>> diff_names(const fs::path& repo, const string& from, const string& to,
                                    string* error) {
    auto r = detail::open_repo(repo, error);
    if (!r)
        return nullopt;
    auto old_commit = detail::resolve_commit(r->get(), from, error);
    if (!old_commit)
        return nullopt;
    auto new_commit = detail::resolve_commit(r->get(), to, error);
    if (!new_commit)
        return nullopt;
    git_tree* raw_old = nullptr;
    git_tree* raw_new = nullptr;
    if (git_commit_tree(&raw_old, old_commit->get()) != 0) {
        detail::set_error(error, "read tree of " + from);
        return nullopt;
    }
    tree_ptr old_tree(raw_old);
    if (git_commit_tree(&raw_new, new_commit->get()) != 0) {
        detail::set_error(error, "read tree of " + to);
        return nullopt;
    }
    tree_ptr new_tree(raw_new);

    git_diff* raw_diff = nullptr;
    if (git_diff_tree_to_tree(&raw_diff, r->get(), old_tree.get(), new_tree.get(), nullptr) != 0) {
        detail::set_error(error, "diff " + from + ".." + to);
        return nullopt;
    }
    diff_ptr diff(raw_diff);
    vector<string> paths;
    size_t n = git_diff_num_deltas(diff.get());
    paths.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const git_diff_delta* delta = git_diff_get_delta(diff.get(), i);
        const char* path =
            delta->status == GIT_DELTA_DELETED ? delta->old_file.path : delta->new_file.path;
        if (path)
            paths.emplace_back(path);
    }
    return paths;
}

} // namespace git
