#include "hosting.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

#include "hosting/hosting_detail.hpp"

namespace {

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string strip_repo_suffix(std::string path) {
    while (!path.empty() && path.back() == '/')
        path.pop_back();
    const std::string suffix = ".git";
    if (path.size() > suffix.size() &&
        path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0)
        path.erase(path.size() - suffix.size());
    while (!path.empty() && path.front() == '/')
        path.erase(path.begin());
    return path;
}

} // namespace

const char* hosting_kind_name(HostingKind kind) {
    switch (kind) {
    case HostingKind::GITHUB:
        return "github";
    case HostingKind::GITLAB:
        return "gitlab";
    case HostingKind::OTHER:
        return "other";
    }
    return "other";
}

RemoteDescriptor parse_remote_url(const std::string& url) {
    static const std::regex url_form(R"(^[A-Za-z][A-Za-z0-9+.-]*://(?:[^@/]+@)?([^/:]+)(?::\d*)?/(.+)$)");
    static const std::regex scp_form(R"(^(?:[^@/]+@)?([^:/]+):(?!/)(.+)$)");
    RemoteDescriptor desc;
    desc.url = url;
    std::smatch m;
    std::string path;
    if (std::regex_match(url, m, url_form) || std::regex_match(url, m, scp_form)) {
        desc.host = to_lower_copy(m[1].str());
        path = strip_repo_suffix(m[2].str());
    } else {
        return desc;
    }
    auto slash = path.rfind('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == path.size())
        return desc;
    desc.owner = path.substr(0, slash);
    desc.repo = path.substr(slash + 1);
    if (desc.host == "github.com" && desc.owner.find('/') == std::string::npos)
        desc.provider = HostingKind::GITHUB;
    else if (desc.host == "gitlab.com")
        desc.provider = HostingKind::GITLAB;
    return desc;
}

std::string redact_url_credentials(const std::string& url) {
    const auto scheme = url.find("://");
    if (scheme == std::string::npos)
        return url;
    const size_t host_start = scheme + 3;
    const size_t path_start = std::min(url.find('/', host_start), url.size());
    const size_t at = url.rfind('@', path_start);
    if (at == std::string::npos || at < host_start)
        return url;
    return url.substr(0, host_start) + url.substr(at + 1);
}

std::string ssh_clone_url(const std::string& host, const std::string& full_name) {
    return "git@" + host + ":" + full_name + ".git";
}

std::unique_ptr<HostingProvider> make_hosting_provider(const RemoteDescriptor& remote,
                                                       const HostingConfig& config,
                                                       HttpClient& http) {
    switch (remote.provider) {
    case HostingKind::GITHUB:
        return std::make_unique<GitHubProvider>(config.github_api, config.github_token, http);
    case HostingKind::GITLAB:
        return std::make_unique<GitLabProvider>(config.gitlab_api, config.gitlab_token, http);
    case HostingKind::OTHER:
        break;
    }
    return nullptr;
}

namespace hosting_detail {

std::string describe_failure(const HttpResponse& resp) {
    if (!resp.error.empty())
        return resp.error;
    return "HTTP " + std::to_string(resp.status);
}

std::optional<nlohmann::json> get_json(HttpClient& http, const std::string& url,
                                       const std::vector<std::string>& headers,
                                       const std::string& auth_header, std::string* error) {
    auto attempt = [&](bool with_auth) -> std::optional<nlohmann::json> {
        std::vector<std::string> hdrs = headers;
        if (with_auth)
            hdrs.push_back(auth_header);
        HttpResponse resp = http.get(url, hdrs);
        if (!resp.ok()) {
            if (error)
                *error = "GET " + url + ": " + describe_failure(resp);
            return std::nullopt;
        }
        try {
            return nlohmann::json::parse(resp.body);
        } catch (const nlohmann::json::parse_error& e) {
            if (error)
                *error = "GET " + url + ": invalid JSON: " + e.what();
            return std::nullopt;
        }
    };
    if (!auth_header.empty()) {
        if (auto j = attempt(true))
            return j;
    }
    return attempt(false);
}

std::string next_page_url(const HttpResponse& resp) {
    for (const auto& h : resp.headers) {
        if (h.size() < 5 || to_lower_copy(h.substr(0, 5)) != "link:")
            continue;
        std::stringstream ss(h.substr(5));
        std::string part;
        while (std::getline(ss, part, ',')) {
            if (part.find("rel=\"next\"") == std::string::npos)
                continue;
            auto start = part.find('<');
            auto end = part.find('>', start);
            if (start != std::string::npos && end != std::string::npos)
                return part.substr(start + 1, end - start - 1);
        }
    }
    return "";
}

std::string string_member(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object())
        return "";
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return "";
    return it->get<std::string>();
}

} // namespace hosting_detail
