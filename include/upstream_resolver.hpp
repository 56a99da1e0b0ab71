#ifndef UPSTREAM_RESOLVER_HPP
#define UPSTREAM_RESOLVER_HPP

#include <string>

#include "hosting.hpp"
#include "http_client.hpp"

/**
 * @brief Finds the canonical repository a remote was forked from.
 */
class UpstreamResolver {
  public:
    virtual ~UpstreamResolver() = default;

    /**
     * @brief Discover the fork parent of @a remote_url.
     *
     * Never throws. Unsupported hosts are reported as
     * @ref DiscoveryStatus::ABSENT without any network traffic.
     */
    virtual UpstreamDiscovery resolve_upstream(const std::string& remote_url) = 0;
};

/**
 * @brief Resolver backed by the GitHub and GitLab APIs.
 */
class HostingUpstreamResolver : public UpstreamResolver {
  public:
    HostingUpstreamResolver(HostingConfig config, HttpClient& http);

    UpstreamDiscovery resolve_upstream(const std::string& remote_url) override;

  private:
    HostingConfig config_;
    HttpClient& http_;
};

#endif // UPSTREAM_RESOLVER_HPP
