#include "git_utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include "git/git_detail.hpp"

using namespace std;

namespace git {

static unsigned int g_libgit_timeout = 0;

/**
 * @brief Read credentials from a file.
 *
 * The file is expected to contain the username on the first line and the
 * password on the second line.
 *
 * @return True if both username and password were read.
 */
static bool read_credential_file(const fs::path& path, std::string& user, std::string& pass) {
    std::ifstream ifs(path);
    if (!ifs)
        return false;
    std::getline(ifs, user);
    std::getline(ifs, pass);
    return !user.empty() && !pass.empty();
}

static std::optional<std::string> safe_getenv(const char* name) {
    const char* v = std::getenv(name);
    if (v)
        return std::string(v);
    return std::nullopt;
}

static void apply_timeout() {
#if LIBGIT2_VER_MAJOR > 1 || (LIBGIT2_VER_MAJOR == 1 && LIBGIT2_VER_MINOR >= 7)
    if (g_libgit_timeout > 0) {
        int ms = static_cast<int>(g_libgit_timeout * 1000);
        git_libgit2_opts(GIT_OPT_SET_SERVER_CONNECT_TIMEOUT, ms);
        git_libgit2_opts(GIT_OPT_SET_SERVER_TIMEOUT, ms);
    }
#endif
}

void set_libgit_timeout(unsigned int seconds) {
    g_libgit_timeout = seconds;
    apply_timeout();
}

/**
 * @brief libgit2 credential callback implementing precedence rules.
 *
 * Credentials are chosen in the following order:
 *  1. Explicit SSH key provided via @ref RemoteAuth.
 *  2. SSH agent.
 *  3. Username/password from file.
 *  4. Username/password from environment variables.
 *  5. Default credential helper.
 *
 * libgit2 calls back again after a rejected credential; the attempt counter
 * stops the chain from looping forever against a server that refuses all of
 * them.
 */
static int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                         unsigned int allowed_types, void* payload) {
    (void)url;
    auto* pl = static_cast<detail::CallbackPayload*>(payload);
    if (pl && ++pl->credential_attempts > 5) {
        git_error_set_str(GIT_ERROR_NET, "authentication failed: credentials rejected");
        return GIT_EAUTH;
    }
    const RemoteAuth* auth = pl ? pl->auth : nullptr;
    auto env_user = safe_getenv("GIT_USERNAME");
    auto env_pass = safe_getenv("GIT_PASSWORD");
    std::string file_user;
    std::string file_pass;
    if (auth && !auth->credential_file.empty())
        read_credential_file(auth->credential_file, file_user, file_pass);
    const char* user =
        username_from_url
            ? username_from_url
            : (!file_user.empty() ? file_user.c_str() : (env_user ? env_user->c_str() : "git"));
    if ((allowed_types & GIT_CREDENTIAL_SSH_KEY) && auth && !auth->ssh_private_key.empty()) {
        std::string pub = auth->ssh_public_key.string();
        std::string priv = auth->ssh_private_key.string();
        if (git_credential_ssh_key_new(out, user, pub.empty() ? nullptr : pub.c_str(),
                                       priv.c_str(), "") == 0)
            return 0;
    }
    if (allowed_types & GIT_CREDENTIAL_SSH_KEY) {
        if (git_credential_ssh_key_from_agent(out, user) == 0)
            return 0;
    }
    if (allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT) {
        if (!file_user.empty() && !file_pass.empty())
            return git_credential_userpass_plaintext_new(out, file_user.c_str(),
                                                         file_pass.c_str());
        if (env_user && env_pass)
            return git_credential_userpass_plaintext_new(out, env_user->c_str(),
                                                         env_pass->c_str());
    }
    if (allowed_types & GIT_CREDENTIAL_USERNAME)
        return git_credential_username_new(out, user);
    return git_credential_default_new(out);
}

static int push_update_cb(const char* refname, const char* status, void* payload) {
    if (status && payload) {
        auto* pl = static_cast<detail::CallbackPayload*>(payload);
        pl->push_rejection = std::string(refname) + ": " + status;
    }
    return 0;
}

namespace detail {

void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

void set_error(std::string* error, const std::string& context) {
    if (!error)
        return;
    set_error(error);
    *error = context + ": " + *error;
}

std::string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

optional<repo_ptr> open_repo(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error, "cannot open " + repo.string());
        return nullopt;
    }
    return repo_ptr(raw);
}

optional<commit_ptr> resolve_commit(git_repository* r, const string& rev, string* error) {
    git_object* raw = nullptr;
    if (git_revparse_single(&raw, r, rev.c_str()) != 0) {
        set_error(error, "cannot resolve " + rev);
        return nullopt;
    }
    object_ptr obj(raw);
    git_object* peeled = nullptr;
    if (git_object_peel(&peeled, obj.get(), GIT_OBJECT_COMMIT) != 0) {
        set_error(error, rev + " is not a commit");
        return nullopt;
    }
    return commit_ptr(reinterpret_cast<git_commit*>(peeled));
}

optional<signature_ptr> make_signature(git_repository* r, string* error) {
    git_signature* sig = nullptr;
    if (git_signature_default(&sig, r) == 0)
        return signature_ptr(sig);
    if (git_signature_now(&sig, "autosubsync", "autosubsync@users.noreply.github.com") == 0)
        return signature_ptr(sig);
    set_error(error, "cannot create signature");
    return nullopt;
}

git_remote_callbacks make_callbacks(CallbackPayload& payload) {
    git_remote_callbacks callbacks = GIT_REMOTE_CALLBACKS_INIT;
    callbacks.credentials = credential_cb;
    callbacks.push_update_reference = push_update_cb;
    callbacks.payload = &payload;
    return callbacks;
}

} // namespace detail

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() {
    git_libgit2_init();
    apply_timeout();
}

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p / ".git", ec);
}

optional<string> get_local_hash(const fs::path& repo, string* error) {
    auto r = detail::open_repo(repo, error);
    if (!r)
        return nullopt;
    git_oid oid;
    if (git_reference_name_to_id(&oid, r->get(), "HEAD") != 0) {
        detail::set_error(error);
        return nullopt;
    }
    return detail::oid_to_hex(oid);
}

optional<string> get_current_branch(const fs::path& repo, string* error) {
    auto r = detail::open_repo(repo, error);
    if (!r)
        return nullopt;
    if (git_repository_head_detached(r->get()) == 1) {
        if (error)
            *error = "HEAD is detached";
        return nullopt;
    }
    git_reference* head = nullptr;
    if (git_repository_head(&head, r->get()) != 0) {
        // Unborn branches still name a branch through the symbolic HEAD.
        git_reference* sym = nullptr;
        if (git_reference_lookup(&sym, r->get(), "HEAD") == 0) {
            reference_ptr sym_ref(sym);
            const char* target = git_reference_symbolic_target(sym);
            string prefix = "refs/heads/";
            if (target && string(target).rfind(prefix, 0) == 0)
                return string(target).substr(prefix.size());
        }
        detail::set_error(error);
        return nullopt;
    }
    reference_ptr ref(head);
    const char* name = git_reference_shorthand(ref.get());
    string branch = name ? name : "";
    if (branch.empty()) {
        detail::set_error(error);
        return nullopt;
    }
    return branch;
}

optional<string> get_remote_url(const fs::path& repo, const string& remote, string* error) {
    auto r = detail::open_repo(repo, error);
    if (!r)
        return nullopt;
    git_remote* raw_remote = nullptr;
    int rc = git_remote_lookup(&raw_remote, r->get(), remote.c_str());
    if (rc == GIT_ENOTFOUND)
        return nullopt;
    if (rc != 0) {
        detail::set_error(error, "cannot look up remote " + remote);
        return nullopt;
    }
    remote_ptr remote_handle(raw_remote);
    const char* url = git_remote_url(remote_handle.get());
    if (!url || !*url) {
        if (error)
            *error = "remote " + remote + " has no URL";
        return nullopt;
    }
    return string(url);
}

bool add_remote(const fs::path& repo, const string& name, const string& url, string* error) {
    auto r = detail::open_repo(repo, error);
    if (!r)
        return false;
    git_remote* raw_remote = nullptr;
    if (git_remote_create(&raw_remote, r->get(), name.c_str(), url.c_str()) != 0) {
        detail::set_error(error, "cannot add remote " + name);
        return false;
    }
    remote_ptr remote_handle(raw_remote);
    return true;
}

bool reference_exists(const fs::path& repo, const string& refname) {
    auto r = detail::open_repo(repo, nullptr);
    if (!r)
        return false;
    git_reference* raw = nullptr;
    if (git_reference_lookup(&raw, r->get(), refname.c_str()) != 0)
        return false;
    reference_ptr ref(raw);
    return true;
}

optional<string> get_cached_remote_head(const fs::path& repo, const string& remote) {
    auto r = detail::open_repo(repo, nullptr);
    if (!r)
        return nullopt;
    git_reference* raw = nullptr;
    string name = "refs/remotes/" + remote + "/HEAD";
    if (git_reference_lookup(&raw, r->get(), name.c_str()) != 0)
        return nullopt;
    reference_ptr ref(raw);
    if (git_reference_type(ref.get()) != GIT_REFERENCE_SYMBOLIC)
        return nullopt;
    string target = git_reference_symbolic_target(ref.get());
    string prefix = "refs/remotes/" + remote + "/";
    if (target.rfind(prefix, 0) != 0)
        return nullopt;
    return target.substr(prefix.size());
}

vector<string> list_remote_branches(const fs::path& repo, const string& remote, string* error) {
    vector<string> branches;
    auto r = detail::open_repo(repo, error);
    if (!r)
        return branches;
    string prefix = "refs/remotes/" + remote + "/";
    git_reference_iterator* raw = nullptr;
    if (git_reference_iterator_glob_new(&raw, r->get(), (prefix + "*").c_str()) != 0) {
        detail::set_error(error, "cannot list " + prefix);
        return branches;
    }
    reference_iterator_ptr it(raw);
    const char* name = nullptr;
    while (git_reference_next_name(&name, it.get()) == 0) {
        string branch = string(name).substr(prefix.size());
        if (branch != "HEAD")
            branches.push_back(branch);
    }
    std::sort(branches.begin(), branches.end());
    return branches;
}

} // namespace git
