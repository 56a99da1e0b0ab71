#ifndef FLEET_HPP
#define FLEET_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "git_utils.hpp"
#include "publisher.hpp"
#include "reconciler.hpp"
#include "submodule.hpp"

namespace fs = std::filesystem;

/**
 * @brief Whether any path ends in `.md`, ignoring case.
 */
bool has_markdown_change(const std::vector<std::string>& files);

/**
 * @brief What the fleet should publish after reconciling every submodule.
 */
struct FleetDecision {
    bool any_markdown_changed = false;
    std::vector<ReconciliationResult> updated_modules; ///< Ahead of origin or moved this run
};

/**
 * @brief Derive the publication decision from reconciliation results.
 *
 * Markdown changes are looked for in both the origin comparison and the
 * files changed during this run.
 */
FleetDecision decide(const std::vector<ReconciliationResult>& results);

struct FleetConfig {
    fs::path root;
    bool dry_run = false;
    git::RemoteAuth auth;
};

/**
 * @brief Reconciles every submodule in manifest order and publishes the
 * resulting pointer updates.
 */
class Fleet {
  public:
    Fleet(FleetConfig config, Reconciler& reconciler, Publisher& publisher);

    /**
     * @brief Run one synchronization pass.
     *
     * Stops at the first failed submodule without pushing or publishing.
     *
     * @return `true` when every step succeeded, including when there was
     *         nothing to publish.
     */
    bool run(const std::vector<SubmoduleSpec>& specs);

    /// Results collected by the last call to run().
    const std::vector<ReconciliationResult>& results() const { return results_; }

  private:
    void report(const FleetDecision& decision) const;
    bool push_updated(const std::vector<ReconciliationResult>& updated);

    FleetConfig config_;
    Reconciler& reconciler_;
    Publisher& publisher_;
    std::vector<ReconciliationResult> results_;
};

#endif // FLEET_HPP
