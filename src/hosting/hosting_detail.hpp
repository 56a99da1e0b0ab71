#ifndef HOSTING_DETAIL_HPP
#define HOSTING_DETAIL_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "http_client.hpp"

namespace hosting_detail {

/**
 * @brief GET @a url and parse the body as JSON.
 *
 * When @a auth_header is non-empty it is sent first; if that request fails
 * in any way the request is repeated once without it, since public
 * repositories stay readable when a token is expired or lacks scope.
 */
std::optional<nlohmann::json> get_json(HttpClient& http, const std::string& url,
                                       const std::vector<std::string>& headers,
                                       const std::string& auth_header, std::string* error);

/// Describe a failed response as `HTTP <code>` or the transport error.
std::string describe_failure(const HttpResponse& resp);

/// Target of the `rel="next"` entry of a `Link` response header.
std::string next_page_url(const HttpResponse& resp);

/// Read a string member, empty when missing or not a string.
std::string string_member(const nlohmann::json& obj, const char* key);

} // namespace hosting_detail

#endif // HOSTING_DETAIL_HPP
