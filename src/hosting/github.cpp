#include <utility>

#include "hosting.hpp"
#include "hosting/hosting_detail.hpp"
#include "logger.hpp"

using hosting_detail::describe_failure;
using hosting_detail::string_member;

GitHubProvider::GitHubProvider(std::string api_base, std::string token, HttpClient& http)
    : api_base_(std::move(api_base)), token_(std::move(token)), http_(http) {
    while (!api_base_.empty() && api_base_.back() == '/')
        api_base_.pop_back();
}

static std::vector<std::string> github_headers() {
    return {"Accept: application/vnd.github+json", "X-GitHub-Api-Version: 2022-11-28"};
}

UpstreamDiscovery GitHubProvider::discover_upstream(const RemoteDescriptor& remote) {
    UpstreamDiscovery result;
    if (remote.provider != HostingKind::GITHUB) {
        result.status = DiscoveryStatus::ABSENT;
        return result;
    }
    log_info("Querying GitHub API for fork parent of " + remote.full_name());
    std::string url = api_base_ + "/repos/" + remote.full_name();
    std::string auth = token_.empty() ? "" : "Authorization: Bearer " + token_;
    auto j = hosting_detail::get_json(http_, url, github_headers(), auth, &result.error);
    if (!j) {
        result.status = DiscoveryStatus::UNKNOWN;
        return result;
    }
    result.error.clear();
    auto parent = j->find("parent");
    std::string parent_name =
        parent != j->end() ? string_member(*parent, "full_name") : std::string();
    if (parent_name.empty()) {
        log_info("No parent detected via GitHub API", {{"repo", remote.full_name()}});
        result.status = DiscoveryStatus::ABSENT;
        return result;
    }
    UpstreamLink link;
    link.url = ssh_clone_url(remote.host, parent_name);
    link.default_branch = string_member(*parent, "default_branch");
    if (link.default_branch.empty())
        link.default_branch = string_member(*j, "default_branch");
    log_info("Found GitHub upstream: " + link.url);
    result.status = DiscoveryStatus::FOUND;
    result.link = std::move(link);
    return result;
}

std::optional<std::string> GitHubProvider::find_pull_request(const std::string& full_name,
                                                             const std::string& head,
                                                             const std::string& base,
                                                             std::string* error) {
    std::vector<std::string> headers = github_headers();
    if (!token_.empty())
        headers.push_back("Authorization: Bearer " + token_);
    std::string url = api_base_ + "/repos/" + full_name +
                      "/pulls?state=open&per_page=100&base=" + url_encode(base);
    while (!url.empty()) {
        HttpResponse resp = http_.get(url, headers);
        if (!resp.ok()) {
            if (error)
                *error = "list pull requests: " + describe_failure(resp);
            return std::nullopt;
        }
        nlohmann::json page;
        try {
            page = nlohmann::json::parse(resp.body);
        } catch (const nlohmann::json::parse_error& e) {
            if (error)
                *error = std::string("list pull requests: invalid JSON: ") + e.what();
            return std::nullopt;
        }
        if (!page.is_array()) {
            if (error)
                *error = "list pull requests: unexpected response";
            return std::nullopt;
        }
        for (const auto& pr : page) {
            auto h = pr.find("head");
            if (h != pr.end() && string_member(*h, "ref") == head)
                return string_member(pr, "html_url");
        }
        url = hosting_detail::next_page_url(resp);
    }
    return std::nullopt;
}

std::optional<std::string> GitHubProvider::create_pull_request(
    const std::string& full_name, const std::string& head, const std::string& base,
    const std::string& title, const std::string& body, std::string* error) {
    std::vector<std::string> headers = github_headers();
    headers.push_back("Content-Type: application/json");
    if (!token_.empty())
        headers.push_back("Authorization: Bearer " + token_);
    nlohmann::json payload{{"title", title},
                           {"body", body},
                           {"head", head},
                           {"base", base},
                           {"maintainer_can_modify", true}};
    HttpResponse resp = http_.post(api_base_ + "/repos/" + full_name + "/pulls", payload.dump(),
                                   headers);
    if (!resp.ok()) {
        if (error) {
            *error = "create pull request: " + describe_failure(resp);
            if (!resp.body.empty())
                *error += " " + resp.body;
        }
        return std::nullopt;
    }
    try {
        std::string html_url = string_member(nlohmann::json::parse(resp.body), "html_url");
        if (html_url.empty()) {
            if (error)
                *error = "create pull request: response has no html_url";
            return std::nullopt;
        }
        return html_url;
    } catch (const nlohmann::json::parse_error& e) {
        if (error)
            *error = std::string("create pull request: invalid JSON: ") + e.what();
        return std::nullopt;
    }
}
