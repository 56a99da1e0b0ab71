#ifndef HOSTING_HPP
#define HOSTING_HPP

#include <memory>
#include <optional>
#include <string>

#include "http_client.hpp"

enum class HostingKind { GITHUB, GITLAB, OTHER };

const char* hosting_kind_name(HostingKind kind);

/**
 * @brief Components of a git remote URL.
 *
 * @ref owner holds the full namespace, which may contain slashes on GitLab.
 */
struct RemoteDescriptor {
    std::string url;
    HostingKind provider = HostingKind::OTHER;
    std::string host;
    std::string owner;
    std::string repo;

    std::string full_name() const { return owner + "/" + repo; }
};

/**
 * @brief Split a remote URL into host, owner and repository name.
 *
 * Accepts scp-like (`git@host:owner/repo.git`), `ssh://`, `https://` and
 * `http://` forms. A trailing `.git` and trailing slash are ignored. Hosts
 * other than github.com and gitlab.com, and URLs that cannot be parsed,
 * yield @ref HostingKind::OTHER.
 */
RemoteDescriptor parse_remote_url(const std::string& url);

/**
 * @brief @a url with any `user[:password]@` part of a `scheme://` authority
 * removed, for logging.
 */
std::string redact_url_credentials(const std::string& url);

/**
 * @brief API endpoints and tokens for the hosting providers.
 *
 * Empty tokens mean anonymous requests.
 */
struct HostingConfig {
    std::string github_api = "https://api.github.com";
    std::string github_token;
    std::string gitlab_api = "https://gitlab.com/api/v4";
    std::string gitlab_token;
};

struct UpstreamLink {
    std::string url;
    std::string default_branch; ///< Upstream default branch, empty if unreported
};

enum class DiscoveryStatus {
    FOUND,  ///< Repository is a fork, @ref UpstreamDiscovery::link is set
    ABSENT, ///< Repository is not a fork, or its host is unsupported
    UNKNOWN ///< The provider could not be queried or answered unexpectedly
};

struct UpstreamDiscovery {
    DiscoveryStatus status = DiscoveryStatus::UNKNOWN;
    std::optional<UpstreamLink> link;
    std::string error;
};

/**
 * @brief Read-only access to a hosting service's repository metadata.
 */
class HostingProvider {
  public:
    virtual ~HostingProvider() = default;

    virtual HostingKind kind() const = 0;

    /**
     * @brief Ask the provider whether @a remote is a fork and of what.
     *
     * Never throws. Network and parse failures produce
     * @ref DiscoveryStatus::UNKNOWN.
     */
    virtual UpstreamDiscovery discover_upstream(const RemoteDescriptor& remote) = 0;
};

/**
 * @brief GitHub REST API v3 client.
 *
 * Besides fork discovery it offers the pull request calls used to publish
 * the rolling automation branch.
 */
class GitHubProvider : public HostingProvider {
  public:
    GitHubProvider(std::string api_base, std::string token, HttpClient& http);

    HostingKind kind() const override { return HostingKind::GITHUB; }
    UpstreamDiscovery discover_upstream(const RemoteDescriptor& remote) override;

    /**
     * @brief Find an open pull request from @a head into @a base.
     *
     * Walks every page of `GET /repos/{repo}/pulls?state=open&base=<base>`.
     *
     * @param full_name `owner/repo` of the target repository.
     * @param error     Left empty when no such pull request exists, filled
     *                  when the listing failed.
     * @return The pull request's `html_url`.
     */
    std::optional<std::string> find_pull_request(const std::string& full_name,
                                                 const std::string& head, const std::string& base,
                                                 std::string* error = nullptr);

    /**
     * @brief Open a pull request that maintainers can modify.
     *
     * @return The new pull request's `html_url`.
     */
    std::optional<std::string> create_pull_request(const std::string& full_name,
                                                   const std::string& head,
                                                   const std::string& base,
                                                   const std::string& title,
                                                   const std::string& body,
                                                   std::string* error = nullptr);

  private:
    std::string api_base_;
    std::string token_;
    HttpClient& http_;
};

/**
 * @brief GitLab REST API v4 client.
 */
class GitLabProvider : public HostingProvider {
  public:
    GitLabProvider(std::string api_base, std::string token, HttpClient& http);

    HostingKind kind() const override { return HostingKind::GITLAB; }
    UpstreamDiscovery discover_upstream(const RemoteDescriptor& remote) override;

  private:
    std::string api_base_;
    std::string token_;
    HttpClient& http_;
};

/**
 * @brief Create the provider matching @a remote.
 *
 * @return `nullptr` for @ref HostingKind::OTHER.
 */
std::unique_ptr<HostingProvider> make_hosting_provider(const RemoteDescriptor& remote,
                                                       const HostingConfig& config,
                                                       HttpClient& http);

/**
 * @brief SSH clone URL of `owner/repo` on @a host.
 */
std::string ssh_clone_url(const std::string& host, const std::string& full_name);

#endif // HOSTING_HPP
