#ifndef BRANCH_NEGOTIATOR_HPP
#define BRANCH_NEGOTIATOR_HPP

#include <filesystem>
#include <optional>
#include <string>

#include "git_utils.hpp"

namespace fs = std::filesystem;

/**
 * @brief Branch a remote's HEAD points at.
 *
 * Queries the remote first, then falls back to the locally cached
 * `refs/remotes/<remote>/HEAD`.
 */
std::optional<std::string> advertised_head_branch(const fs::path& repo, const std::string& remote,
                                                  const git::RemoteAuth* auth = nullptr);

/**
 * @brief Choose the branch a submodule is worked on.
 *
 * The branch declared in `.gitmodules` wins. Otherwise the `origin` HEAD,
 * then the checked out branch, then `main`.
 */
std::string determine_working_branch(const fs::path& repo, const std::string& declared_branch,
                                     const git::RemoteAuth* auth = nullptr);

/**
 * @brief Force the working branch into place.
 *
 * Resets the branch to `origin/<branch>` and tracks it when that ref exists,
 * otherwise creates the branch at the current HEAD. Local changes are
 * discarded.
 */
bool checkout_working_branch(const fs::path& repo, const std::string& branch,
                             std::string* error = nullptr);

/**
 * @brief Pick the upstream branch to merge from, before verifying it exists.
 *
 * @param hint Default branch reported by the hosting provider during this
 *             run, or empty.
 */
std::string determine_upstream_branch(const fs::path& repo, const std::string& hint,
                                      const git::RemoteAuth* auth = nullptr);

/**
 * @brief Confirm @a candidate exists under `upstream/` after fetching.
 *
 * Falls back to `main`, `master` and finally the first upstream branch,
 * warning at each step.
 *
 * @return The branch to merge, or `std::nullopt` when upstream has no
 *         branches at all.
 */
std::optional<std::string> settle_upstream_branch(const fs::path& repo,
                                                  const std::string& candidate,
                                                  std::string* error = nullptr);

#endif // BRANCH_NEGOTIATOR_HPP
