#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <string>
#include <utility>
#include <vector>

/**
 * @brief Result of a single HTTP exchange.
 *
 * Transport failures (DNS, connect, timeout) leave @ref status at `0` and
 * describe the problem in @ref error. Any received response, including
 * non-2xx ones, carries its status code and body.
 */
struct HttpResponse {
    long status = 0;
    std::string body;
    std::vector<std::string> headers; ///< Raw `Name: value` response header lines
    std::string error;

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

/**
 * @brief Minimal blocking HTTP interface used by the hosting providers and
 * the forum notifier.
 */
class HttpClient {
  public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, const std::vector<std::string>& headers) = 0;

    /**
     * @brief POST @a body to @a url.
     *
     * The caller supplies the `Content-Type` header matching the body.
     */
    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const std::vector<std::string>& headers) = 0;
};

/**
 * @brief libcurl backed @ref HttpClient.
 *
 * Each request uses its own easy handle. A `User-Agent` identifying the tool
 * is added to every request.
 */
class CurlHttpClient : public HttpClient {
  public:
    explicit CurlHttpClient(long timeout_seconds = 30);

    HttpResponse get(const std::string& url, const std::vector<std::string>& headers) override;
    HttpResponse post(const std::string& url, const std::string& body,
                      const std::vector<std::string>& headers) override;

  private:
    HttpResponse perform(const char* verb, const std::string& url, const std::string* body,
                         const std::vector<std::string>& headers);

    long timeout_seconds_;
};

/**
 * @brief Percent-encode a string for use in a URL path segment or form value.
 */
std::string url_encode(const std::string& value);

/**
 * @brief Build an `application/x-www-form-urlencoded` body.
 */
std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields);

#endif // HTTP_CLIENT_HPP
