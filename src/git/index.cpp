#include "git_utils.hpp"
#include "git/git_detail.hpp"

using namespace std;

namespace git {

bool stage_submodule(const fs::path& repo, const string& path, string* error) {
    auto r = detail::open_repo(repo, error);
    if (!r)
        return false;
    git_submodule* raw = nullptr;
    if (git_submodule_lookup(&raw, r->get(), path.c_str()) != 0) {
        detail::set_error(error, "submodule " + path);
        return false;
    }
    submodule_ptr sm(raw);
    if (git_submodule_add_to_index(sm.get(), 1) != 0) {
        detail::set_error(error, "stage " + path);
        return false;
    }
    return true;
}

optional<bool> index_differs_from_head(const fs::path& repo, string* error) {
    auto r = detail::open_repo(repo, error);
    if (!r)
        return nullopt;
    auto head = detail::resolve_commit(r->get(), "HEAD", error);
    if (!head)
        return nullopt;
    git_tree* raw_tree = nullptr;
    if (git_commit_tree(&raw_tree, head->get()) != 0) {
        detail::set_error(error, "read HEAD tree");
        return nullopt;
    }
    tree_ptr tree(raw_tree);
    git_index* raw_idx = nullptr;
    if (git_repository_index(&raw_idx, r->get()) != 0) {
        detail::set_error(error, "open index");
        return nullopt;
    }
    index_ptr idx(raw_idx);
    git_diff* raw_diff = nullptr;
    if (git_diff_tree_to_index(&raw_diff, r->get(), tree.get(), idx.get(), nullptr) != 0) {
        detail::set_error(error, "diff index");
        return nullopt;
    }
    diff_ptr diff(raw_diff);
    return git_diff_num_deltas(diff.get()) > 0;
}

optional<string> commit_index(const fs::path& repo, const string& message, string* error) {
    auto r = detail::open_repo(repo, error);
    if (!r)
        return nullopt;
    auto parent = detail::resolve_commit(r->get(), "HEAD", error);
    if (!parent)
        return nullopt;
    git_index* raw_idx = nullptr;
    if (git_repository_index(&raw_idx, r->get()) != 0) {
        detail::set_error(error, "open index");
        return nullopt;
    }
    index_ptr idx(raw_idx);
    git_oid tree_oid;
    if (git_index_write_tree(&tree_oid, idx.get()) != 0) {
        detail::set_error(error, "write tree");
        return nullopt;
    }
    git_tree* raw_tree = nullptr;
    if (git_tree_lookup(&raw_tree, r->get(), &tree_oid) != 0) {
        detail::set_error(error, "lookup tree");
        return nullopt;
    }
    tree_ptr tree(raw_tree);
    auto sig = detail::make_signature(r->get(), error);
    if (!sig)
        return nullopt;
    git_oid commit_oid;
    if (git_commit_create_v(&commit_oid, r->get(), "HEAD", sig->get(), sig->get(), nullptr,
                            message.c_str(), tree.get(), 1, parent->get()) != 0) {
        detail::set_error(error, "commit");
        return nullopt;
    }
    return detail::oid_to_hex(commit_oid);
}

} // namespace git
