#include "http_client.hpp"

#include <curl/curl.h>
#include <mutex>
#include <sstream>

#include "version.hpp"

namespace {

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
    curl_slist* list{nullptr};
    CurlSlist() = default;
    ~CurlSlist() { curl_slist_free_all(list); }
    void append(const std::string& s) { list = curl_slist_append(list, s.c_str()); }
    curl_slist* get() const { return list; }
    CurlSlist(const CurlSlist&) = delete;
    CurlSlist& operator=(const CurlSlist&) = delete;
};

CURL* new_easy_handle() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    return curl_easy_init();
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::vector<std::string>*>(userdata);
    std::string line(buffer, size * nitems);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();
    if (!line.empty())
        headers->push_back(line);
    return size * nitems;
}

std::string format_curl_error(const char* verb, const std::string& url, CURLcode code,
                              const char* errbuf) {
    std::ostringstream oss;
    oss << "curl " << verb << ' ' << url << " failed: " << curl_easy_strerror(code);
    if (errbuf != nullptr && errbuf[0] != '\0')
        oss << " - " << errbuf;
    return oss.str();
}

} // namespace

CurlHttpClient::CurlHttpClient(long timeout_seconds) : timeout_seconds_(timeout_seconds) {}

HttpResponse CurlHttpClient::get(const std::string& url, const std::vector<std::string>& headers) {
    return perform("GET", url, nullptr, headers);
}

HttpResponse CurlHttpClient::post(const std::string& url, const std::string& body,
                                  const std::vector<std::string>& headers) {
    return perform("POST", url, &body, headers);
}

HttpResponse CurlHttpClient::perform(const char* verb, const std::string& url,
                                     const std::string* body,
                                     const std::vector<std::string>& headers) {
    HttpResponse resp;
    CURL* curl = new_easy_handle();
    if (!curl) {
        resp.error = "failed to initialize curl";
        return resp;
    }
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp.headers);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    if (timeout_seconds_ > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout_seconds_);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    }
    if (body) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }
    CurlSlist header_list;
    for (const auto& h : headers)
        header_list.append(h);
    header_list.append(std::string("User-Agent: ") + AUTOSUBSYNC_USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        resp.error = format_curl_error(verb, url, res, errbuf);
        resp.status = 0;
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    }
    curl_easy_cleanup(curl);
    return resp;
}

std::string url_encode(const std::string& value) {
    if (value.empty())
        return value;
    CURL* curl = new_easy_handle();
    if (!curl)
        return value;
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    std::string encoded = escaped ? escaped : value;
    curl_free(escaped);
    curl_easy_cleanup(curl);
    return encoded;
}

std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty())
            out += '&';
        out += url_encode(key) + "=" + url_encode(value);
    }
    return out;
}
