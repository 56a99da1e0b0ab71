#include "upstream_resolver.hpp"

#include <utility>

#include "logger.hpp"

HostingUpstreamResolver::HostingUpstreamResolver(HostingConfig config, HttpClient& http)
    : config_(std::move(config)), http_(http) {}

UpstreamDiscovery HostingUpstreamResolver::resolve_upstream(const std::string& remote_url) {
    RemoteDescriptor remote = parse_remote_url(remote_url);
    auto provider = make_hosting_provider(remote, config_, http_);
    if (!provider) {
        log_debug("No hosting provider for " + redact_url_credentials(remote_url) +
                  "; treating as canonical");
        UpstreamDiscovery absent;
        absent.status = DiscoveryStatus::ABSENT;
        return absent;
    }
    UpstreamDiscovery result = provider->discover_upstream(remote);
    if (result.status == DiscoveryStatus::UNKNOWN)
        log_warning("Upstream discovery failed for " + remote.full_name() + " on " +
                        hosting_kind_name(remote.provider),
                    result.error);
    return result;
}
