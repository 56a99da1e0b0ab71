#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

/**
 * @brief Configure the libgit2 server connect and I/O timeouts.
 *
 * Has no effect with libgit2 releases older than 1.7.
 */
void set_libgit_timeout(unsigned int seconds);

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    GitHandle(GitHandle&& o) noexcept : h(o.h) { o.h = nullptr; }
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;
using tree_ptr = GitHandle<git_tree, git_tree_free>;
using index_ptr = GitHandle<git_index, git_index_free>;
using diff_ptr = GitHandle<git_diff, git_diff_free>;
using revwalk_ptr = GitHandle<git_revwalk, git_revwalk_free>;
using annotated_commit_ptr = GitHandle<git_annotated_commit, git_annotated_commit_free>;
using signature_ptr = GitHandle<git_signature, git_signature_free>;
using submodule_ptr = GitHandle<git_submodule, git_submodule_free>;
using config_ptr = GitHandle<git_config, git_config_free>;
using reference_iterator_ptr = GitHandle<git_reference_iterator, git_reference_iterator_free>;
using index_conflict_iterator_ptr =
    GitHandle<git_index_conflict_iterator, git_index_conflict_iterator_free>;

/**
 * @brief Credential sources offered to remotes during fetch and push.
 *
 * An explicit SSH key wins, then the SSH agent, then a username/password
 * pair from @ref credential_file or the `GIT_USERNAME` / `GIT_PASSWORD`
 * environment variables, then the default credential helper.
 */
struct RemoteAuth {
    fs::path ssh_public_key;
    fs::path ssh_private_key;
    fs::path credential_file;
};

// The utility functions below assume libgit2 is already initialized. Each
// opens the repository at the given path for the duration of the call.

/**
 * @brief Determine whether the given path holds git metadata.
 *
 * @param p Filesystem path to check.
 * @return `true` if @a p contains a `.git` directory or a `.git` file (the
 *         gitfile form used by initialized submodules).
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Get the commit hash pointed to by `HEAD`.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return 40 character hexadecimal commit hash or `std::nullopt` on error.
 */
std::optional<std::string> get_local_hash(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Retrieve the currently checked out branch name.
 *
 * @return Branch name or `std::nullopt` when HEAD is detached or unborn.
 */
std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Obtain the URL of the specified remote.
 *
 * @param repo   Path to a Git repository.
 * @param remote Remote name.
 * @param error  Optional output string. Left empty when the remote simply
 *               does not exist, filled when the lookup itself failed.
 * @return Remote URL or `std::nullopt`.
 */
std::optional<std::string> get_remote_url(const fs::path& repo, const std::string& remote,
                                          std::string* error = nullptr);

/**
 * @brief Register a new remote with the default fetch refspec.
 */
bool add_remote(const fs::path& repo, const std::string& name, const std::string& url,
                std::string* error = nullptr);

/**
 * @brief Fetch a remote using its configured refspecs.
 *
 * @param prune Remove remote-tracking references that no longer exist on the
 *              remote.
 */
bool fetch_remote(const fs::path& repo, const std::string& remote, bool prune,
                  const RemoteAuth* auth = nullptr, std::string* error = nullptr);

/**
 * @brief Push a local branch to a remote branch.
 *
 * Rejections reported by the server (non fast-forward, protected branch)
 * are treated as failures.
 */
bool push_branch(const fs::path& repo, const std::string& remote, const std::string& local_branch,
                 const std::string& remote_branch, const RemoteAuth* auth = nullptr,
                 std::string* error = nullptr);

/**
 * @brief Ask a remote which branch its HEAD points to.
 *
 * Connects to the remote and reads the advertised symbolic HEAD, so no local
 * remote-tracking state is required.
 *
 * @param error Left empty when the remote advertises no HEAD, filled when the
 *              remote could not be queried.
 * @return Branch name without the `refs/heads/` prefix.
 */
std::optional<std::string> get_remote_head_branch(const fs::path& repo, const std::string& remote,
                                                  const RemoteAuth* auth = nullptr,
                                                  std::string* error = nullptr);

/**
 * @brief Read the branch named by the local `refs/remotes/<remote>/HEAD`
 * symbolic reference.
 */
std::optional<std::string> get_cached_remote_head(const fs::path& repo, const std::string& remote);

/**
 * @brief Check whether a fully qualified reference exists.
 */
bool reference_exists(const fs::path& repo, const std::string& refname);

/**
 * @brief List the remote-tracking branches of a remote.
 *
 * @return Branch names without the `<remote>/` prefix, sorted, `HEAD`
 *         excluded.
 */
std::vector<std::string> list_remote_branches(const fs::path& repo, const std::string& remote,
                                              std::string* error = nullptr);

/**
 * @brief Force-create @a branch at @a start_point and check it out.
 *
 * Equivalent to `git checkout -B <branch> [<start_point>]`: the branch is
 * reset to the start point even when it already exists, and the working
 * tree is forcibly updated. When @a start_point names a remote-tracking
 * branch it becomes the branch's upstream. An empty @a start_point keeps
 * the current HEAD commit. Submodule working trees are left untouched.
 */
bool checkout_branch(const fs::path& repo, const std::string& branch,
                     const std::string& start_point, std::string* error = nullptr);

enum class MergeOutcome { UP_TO_DATE, FAST_FORWARD, MERGED, CONFLICT, FAILED };

struct MergeResult {
    MergeOutcome outcome = MergeOutcome::FAILED;
    std::vector<std::string> conflicts; ///< Paths with unresolved conflicts
    std::string error;
};

/**
 * @brief Merge a reference into the checked out branch.
 *
 * Fast-forwards when possible, otherwise records a merge commit with
 * @a message. On conflict the merge is aborted: the working tree is reset to
 * the pre-merge HEAD and the merge state is cleaned up, so the repository is
 * never left mid-merge.
 */
MergeResult merge_ref(const fs::path& repo, const std::string& refname, const std::string& message);

/**
 * @brief Count commits reachable from @a to but not from @a from.
 */
std::optional<size_t> count_commits(const fs::path& repo, const std::string& from,
                                    const std::string& to, std::string* error = nullptr);

/**
 * @brief List paths that differ between the trees of two revisions.
 */
std::optional<std::vector<std::string>> diff_names(const fs::path& repo, const std::string& from,
                                                   const std::string& to,
                                                   std::string* error = nullptr);

/**
 * @brief Stage the current HEAD of the submodule at @a path as a gitlink.
 */
bool stage_submodule(const fs::path& repo, const std::string& path, std::string* error = nullptr);

/**
 * @brief Check whether the index differs from the tree of HEAD.
 */
std::optional<bool> index_differs_from_head(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Commit the current index on top of HEAD.
 *
 * @return Hash of the new commit.
 */
std::optional<std::string> commit_index(const fs::path& repo, const std::string& message,
                                        std::string* error = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
