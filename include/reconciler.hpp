#ifndef RECONCILER_HPP
#define RECONCILER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "git_utils.hpp"
#include "submodule.hpp"
#include "upstream_resolver.hpp"

namespace fs = std::filesystem;

enum class ReconcileStep {
    NONE,
    FETCH_ORIGIN,
    CHECKOUT,
    UPSTREAM_REMOTE,
    FETCH_UPSTREAM,
    UPSTREAM_BRANCH,
    MERGE,
    MEASURE
};

const char* reconcile_step_name(ReconcileStep step);

/**
 * @brief Outcome of reconciling one submodule.
 */
struct ReconciliationResult {
    std::string name;
    std::string path;
    std::string working_branch;
    std::string upstream_url;                       ///< Empty for canonical repositories
    size_t ahead_count = 0;                         ///< Commits in `origin/<branch>..HEAD`
    std::vector<std::string> changed_files;         ///< Tree diff `origin/<branch>..HEAD`
    std::vector<std::string> session_changed_files; ///< Tree diff between pre and post HEAD
    bool had_head_change = false;
    bool skipped = false;
    bool ok = true;
    ReconcileStep failed_step = ReconcileStep::NONE;
    std::string error;
};

/**
 * @brief Brings one submodule up to date with its origin and upstream.
 */
class Reconciler {
  public:
    virtual ~Reconciler() = default;

    /**
     * @brief Reconcile the submodule described by @a spec.
     *
     * Never throws. Failures are reported through
     * @ref ReconciliationResult::ok and @ref ReconciliationResult::failed_step.
     */
    virtual ReconciliationResult reconcile(const SubmoduleSpec& spec) = 0;
};

/**
 * @brief @ref Reconciler operating on submodule clones with libgit2.
 *
 * For each submodule: fetch `origin`, force the working branch, find or
 * discover `upstream`, merge the upstream branch and measure how far the
 * result is ahead of `origin`.
 */
class SubmoduleReconciler : public Reconciler {
  public:
    SubmoduleReconciler(fs::path root, UpstreamResolver& resolver, git::RemoteAuth auth = {});

    ReconciliationResult reconcile(const SubmoduleSpec& spec) override;

  private:
    bool merge_upstream(const fs::path& dir, ReconciliationResult& res,
                        const std::string& upstream_hint);
    void measure(const fs::path& dir, const std::string& pre_head, ReconciliationResult& res);

    fs::path root_;
    UpstreamResolver& resolver_;
    git::RemoteAuth auth_;
};

/**
 * @brief Default message git uses when merging a remote-tracking branch.
 */
std::string upstream_merge_message(const std::string& upstream_branch,
                                   const std::string& working_branch);

#endif // RECONCILER_HPP
