#ifndef PUBLISHER_HPP
#define PUBLISHER_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "forum_notifier.hpp"
#include "git_utils.hpp"
#include "hosting.hpp"
#include "http_client.hpp"
#include "reconciler.hpp"

namespace fs = std::filesystem;

/**
 * @brief Settings for publishing submodule pointer updates.
 */
struct PublishConfig {
    fs::path root;
    std::string automation_branch = "auto/submodule-updates";
    std::string github_repository; ///< `owner/repo` used when origin is not on GitHub
    std::string github_output;     ///< File receiving GitHub Actions step outputs
    bool dry_run = false;
    bool notify = true;
    git::RemoteAuth auth;
};

/**
 * @brief Receives the submodules that changed during a run.
 */
class Publisher {
  public:
    virtual ~Publisher() = default;

    /**
     * @brief Publish the new pointers of @a updated_modules.
     *
     * @return `false` on a fatal failure. Pull request and notification
     *         problems are not fatal.
     */
    virtual bool publish(const std::vector<ReconciliationResult>& updated_modules) = 0;
};

enum class PublishState {
    IDLE,
    CHECKOUT_BASE,
    CHECKOUT_AUTOMATION_BRANCH,
    STAGE_PATHS,
    COMMIT,
    PUSH,
    PULL_REQUEST,
    NOTIFY,
    DONE,
    FAILED
};

const char* publish_state_name(PublishState state);

/**
 * @brief Commits the bumped gitlinks on the rolling automation branch and
 * opens a single pull request for them.
 *
 * Runs `CHECKOUT_BASE`, `CHECKOUT_AUTOMATION_BRANCH`, `STAGE_PATHS`,
 * `COMMIT`, then (unless dry run) `PUSH`, `PULL_REQUEST` and `NOTIFY`.
 * An existing open pull request for the automation branch is reused, so
 * repeated runs never open duplicates.
 */
class PublicationManager : public Publisher {
  public:
    PublicationManager(PublishConfig config, HostingConfig hosting, HttpClient& http,
                       const ForumNotifier* forum = nullptr);

    bool publish(const std::vector<ReconciliationResult>& updated_modules) override;

    /// State reached by the last call to publish().
    PublishState state() const { return state_; }

    /// Pull request URL found or created by the last call to publish().
    const std::string& pull_request_url() const { return pr_url_; }

    /// Whether the last call to publish() opened a new pull request.
    bool created_pull_request() const { return pr_created_; }

  private:
    bool checkout_base();
    bool checkout_automation_branch();
    bool stage_and_commit(const std::vector<std::string>& paths, bool& committed);
    bool push();
    void open_pull_request(const std::string& title, const std::string& body);
    void write_github_output(const std::string& full_name) const;
    bool fail(const std::string& message);

    PublishConfig config_;
    HostingConfig hosting_;
    HttpClient& http_;
    const ForumNotifier* forum_;
    PublishState state_ = PublishState::IDLE;
    std::string base_branch_;
    std::string pr_url_;
    bool pr_created_ = false;
};

constexpr const char* PUBLISH_COMMIT_TITLE = "Update submodule references";

/**
 * @brief Pull request body listing @a paths.
 */
std::string publish_commit_body(const std::vector<std::string>& paths);

#endif // PUBLISHER_HPP
