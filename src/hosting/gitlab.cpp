#include <utility>

#include "hosting.hpp"
#include "hosting/hosting_detail.hpp"
#include "logger.hpp"

using hosting_detail::string_member;

GitLabProvider::GitLabProvider(std::string api_base, std::string token, HttpClient& http)
    : api_base_(std::move(api_base)), token_(std::move(token)), http_(http) {
    while (!api_base_.empty() && api_base_.back() == '/')
        api_base_.pop_back();
}

UpstreamDiscovery GitLabProvider::discover_upstream(const RemoteDescriptor& remote) {
    UpstreamDiscovery result;
    if (remote.provider != HostingKind::GITLAB) {
        result.status = DiscoveryStatus::ABSENT;
        return result;
    }
    log_info("Querying GitLab API for fork parent of " + remote.full_name());
    std::string url = api_base_ + "/projects/" + url_encode(remote.full_name());
    std::string auth = token_.empty() ? "" : "PRIVATE-TOKEN: " + token_;
    auto j = hosting_detail::get_json(http_, url, {"Accept: application/json"}, auth,
                                      &result.error);
    if (!j) {
        result.status = DiscoveryStatus::UNKNOWN;
        return result;
    }
    result.error.clear();
    auto forked = j->find("forked_from_project");
    std::string parent_ns =
        forked != j->end() ? string_member(*forked, "path_with_namespace") : std::string();
    if (parent_ns.empty()) {
        log_info("No parent detected via GitLab API", {{"project", remote.full_name()}});
        result.status = DiscoveryStatus::ABSENT;
        return result;
    }
    UpstreamLink link;
    link.url = ssh_clone_url(remote.host, parent_ns);
    link.default_branch = string_member(*forked, "default_branch");
    if (link.default_branch.empty())
        link.default_branch = string_member(*j, "default_branch");
    log_info("Found GitLab upstream: " + link.url);
    result.status = DiscoveryStatus::FOUND;
    result.link = std::move(link);
    return result;
}
