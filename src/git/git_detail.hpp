#ifndef GIT_DETAIL_HPP
#define GIT_DETAIL_HPP

// Helpers shared by the git_utils translation units. Not part of the public
// interface.

#include <string>
#include <optional>

#include "git_utils.hpp"

namespace git::detail {

/// Populate @a error with the last libgit2 error message.
void set_error(std::string* error);

/// Populate @a error with `context: <libgit2 message>`.
void set_error(std::string* error, const std::string& context);

/// Open the repository at @a repo, reporting failures through @a error.
std::optional<repo_ptr> open_repo(const fs::path& repo, std::string* error);

/// Peel a revision expression to a commit.
std::optional<commit_ptr> resolve_commit(git_repository* r, const std::string& rev,
                                         std::string* error);

/// Signature from the repository configuration, or the tool identity.
std::optional<signature_ptr> make_signature(git_repository* r, std::string* error);

struct CallbackPayload {
    const RemoteAuth* auth = nullptr;
    int credential_attempts = 0;
    std::string push_rejection;
};

/// Remote callbacks wired to the credential chain of @ref RemoteAuth.
git_remote_callbacks make_callbacks(CallbackPayload& payload);

std::string oid_to_hex(const git_oid& oid);

} // namespace git::detail

#endif // GIT_DETAIL_HPP
