#include "git_utils.hpp"
#include "git/git_detail.hpp"

using namespace std;

namespace git {

static optional<remote_ptr> lookup_remote(git_repository* r, const string& remote, string* error) {
    git_remote* raw = nullptr;
    if (git_remote_lookup(&raw, r, remote.c_str()) != 0) {
        detail::set_error(error, "remote " + remote + " not found");
        return nullopt;
    }
    return remote_ptr(raw);
}

bool fetch_remote(const fs::path& repo, const string& remote, bool prune, const RemoteAuth* auth,
                  string* error) {
    auto r = detail::open_repo(repo, error);
    if (!r)
        return false;
    auto remote_handle = lookup_remote(r->get(), remote, error);
    if (!remote_handle)
        return false;
    detail::CallbackPayload payload;
    payload.auth = auth;
    git_fetch_options fetch_opts = GIT_FETCH_OPTIONS_INIT;
    fetch_opts.callbacks = detail::make_callbacks(payload);
    fetch_opts.prune = prune ? GIT_FETCH_PRUNE : GIT_FETCH_NO_PRUNE;
    if (git_remote_fetch(remote_handle->get(), nullptr, &fetch_opts, nullptr) != 0) {
        detail::set_error(error, "fetch " + remote);
        return false;
    }
    return true;
}

bool push_branch(const fs::path& repo, const string& remote, const string& local_branch,
                 const string& remote_branch, const RemoteAuth* auth, string* error) {
    auto r = detail::open_repo(repo, error);
    if (!r)
        return false;
    auto remote_handle = lookup_remote(r->get(), remote, error);
    if (!remote_handle)
        return false;
    detail::CallbackPayload payload;
    payload.auth = auth;
    git_push_options push_opts = GIT_PUSH_OPTIONS_INIT;
    push_opts.callbacks = detail::make_callbacks(payload);
    string refspec = "refs/heads/" + local_branch + ":refs/heads/" + remote_branch;
    char* specs[] = {const_cast<char*>(refspec.c_str())};
    git_strarray arr = {specs, 1};
    if (git_remote_push(remote_handle->get(), &arr, &push_opts) != 0) {
        detail::set_error(error, "push " + refspec + " to " + remote);
        return false;
    }
    if (!payload.push_rejection.empty()) {
        if (error)
            *error = "push to " + remote + " rejected: " + payload.push_rejection;
        return false;
    }
    return true;
}

optional<string> get_remote_head_branch(const fs::path& repo, const string& remote,
                                        const RemoteAuth* auth, string* error) {
    auto r = detail::open_repo(repo, error);
    if (!r)
        return nullopt;
    auto remote_handle = lookup_remote(r->get(), remote, error);
    if (!remote_handle)
        return nullopt;
    detail::CallbackPayload payload;
    payload.auth = auth;
    git_remote_callbacks callbacks = detail::make_callbacks(payload);
    if (git_remote_connect(remote_handle->get(), GIT_DIRECTION_FETCH, &callbacks, nullptr,
                           nullptr) != 0) {
        detail::set_error(error, "connect " + remote);
        return nullopt;
    }
    git_buf buf = {nullptr, 0, 0};
    int rc = git_remote_default_branch(&buf, remote_handle->get());
    optional<string> branch;
    if (rc == 0 && buf.ptr) {
        string name = buf.ptr;
        const string prefix = "refs/heads/";
        branch = name.rfind(prefix, 0) == 0 ? name.substr(prefix.size()) : name;
    } else if (rc != GIT_ENOTFOUND) {
        detail::set_error(error, "read HEAD of " + remote);
    }
    git_buf_dispose(&buf);
    git_remote_disconnect(remote_handle->get());
    return branch;
}

} // namespace git
