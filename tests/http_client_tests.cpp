#include "test_common.hpp"
#include "forum_notifier.hpp"
#include "http_client.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace autosubsync::test_support;

// Answers a single HTTP request on 127.0.0.1 with a canned response.
class LoopbackServer {
  public:
    explicit LoopbackServer(std::string response) : response_(std::move(response)) {
        srv_ = socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(srv_ >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(bind(srv_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(listen(srv_, 1) == 0);
        socklen_t len = sizeof(addr);
        getsockname(srv_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackServer() {
        shutdown(srv_, SHUT_RDWR);
        if (thread_.joinable())
            thread_.join();
        close(srv_);
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    /// Full request text once the exchange finished.
    std::string request() {
        if (thread_.joinable())
            thread_.join();
        return request_;
    }

  private:
    void serve() {
        int cli = accept(srv_, nullptr, nullptr);
        if (cli < 0)
            return;
        char buf[4096];
        size_t expected = std::string::npos;
        while (expected == std::string::npos || request_.size() < expected) {
            ssize_t n = read(cli, buf, sizeof(buf));
            if (n <= 0)
                break;
            request_.append(buf, static_cast<size_t>(n));
            auto end = request_.find("\r\n\r\n");
            if (end == std::string::npos)
                continue;
            size_t body_len = 0;
            auto cl = request_.find("Content-Length: ");
            if (cl != std::string::npos && cl < end)
                body_len = std::stoul(request_.substr(cl + 16));
            expected = end + 4 + body_len;
        }
        ssize_t written = write(cli, response_.c_str(), response_.size());
        (void)written;
        close(cli);
    }

    std::string response_;
    int srv_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    std::string request_;
};

static std::string http_response(int status, const std::string& reason, const std::string& body,
                                 const std::string& extra_headers = "") {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason +
           "\r\nContent-Length: " + std::to_string(body.size()) + "\r\nConnection: close\r\n" +
           extra_headers + "\r\n" + body;
}

TEST_CASE("CurlHttpClient performs GET with headers") {
    LoopbackServer server(http_response(200, "OK", "[1,2]", "Link: <http://x/next>; rel=\"next\"\r\n"));
    CurlHttpClient http(5);
    HttpResponse resp = http.get(server.url("/repos/a/b"), {"Accept: application/json"});
    REQUIRE(resp.ok());
    REQUIRE(resp.status == 200);
    REQUIRE(resp.body == "[1,2]");
    bool saw_link = false;
    for (const auto& h : resp.headers)
        saw_link = saw_link || h.rfind("Link:", 0) == 0;
    REQUIRE(saw_link);
    std::string req = server.request();
    REQUIRE(req.rfind("GET /repos/a/b HTTP/1.1", 0) == 0);
    REQUIRE(req.find("Accept: application/json") != std::string::npos);
    REQUIRE(req.find("User-Agent: autosubsync/") != std::string::npos);
}

TEST_CASE("CurlHttpClient keeps non-2xx responses") {
    LoopbackServer server(http_response(404, "Not Found", "{\"message\":\"Not Found\"}"));
    CurlHttpClient http(5);
    HttpResponse resp = http.get(server.url("/missing"), {});
    REQUIRE_FALSE(resp.ok());
    REQUIRE(resp.status == 404);
    REQUIRE(resp.error.empty());
    REQUIRE(resp.body.find("Not Found") != std::string::npos);
}

TEST_CASE("CurlHttpClient reports transport failures") {
    uint16_t port = 0;
    {
        // Reserve a port and release it so nothing listens there.
        int s = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        getsockname(s, reinterpret_cast<sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);
        close(s);
    }
    CurlHttpClient http(2);
    HttpResponse resp = http.get("http://127.0.0.1:" + std::to_string(port) + "/", {});
    REQUIRE(resp.status == 0);
    REQUIRE_FALSE(resp.error.empty());
    REQUIRE_FALSE(resp.ok());
}

TEST_CASE("form_encode escapes reserved characters") {
    REQUIRE(form_encode({{"thread_id", "95078"}, {"message", "a b&c=d"}}) ==
            "thread_id=95078&message=a%20b%26c%3Dd");
    REQUIRE(url_encode("group/sub") == "group%2Fsub");
}

TEST_CASE("ForumNotifier posts a reply to the thread") {
    LoopbackServer server(http_response(200, "OK", "{\"success\":true}"));
    CurlHttpClient http(5);
    ForumConfig cfg;
    cfg.base_url = server.url("/api/");
    cfg.api_key = "key123";
    cfg.api_user = "42";
    cfg.thread_id = 777;
    ForumNotifier forum(cfg, http);
    REQUIRE(forum.notify("review https://github.com/acme/super/pull/3"));
    std::string req = server.request();
    REQUIRE(req.rfind("POST /api/posts/ HTTP/1.1", 0) == 0);
    REQUIRE(req.find("XF-Api-Key: key123") != std::string::npos);
    REQUIRE(req.find("XF-Api-User: 42") != std::string::npos);
    REQUIRE(req.find("Content-Type: application/x-www-form-urlencoded") != std::string::npos);
    REQUIRE(req.find("thread_id=777&message=review%20https%3A%2F%2Fgithub.com") !=
            std::string::npos);
}

TEST_CASE("ForumNotifier failures are reported, not thrown") {
    LoopbackServer server(http_response(403, "Forbidden", "{\"errors\":[]}"));
    CurlHttpClient http(5);
    ForumConfig cfg;
    cfg.base_url = server.url("/api");
    cfg.api_key = "bad";
    ForumNotifier forum(cfg, http);
    REQUIRE_FALSE(forum.notify("hello"));
    server.request();
}

TEST_CASE("ForumNotifier skips an incomplete configuration") {
    FakeHttpClient http;
    ForumConfig cfg;
    cfg.api_key.clear();
    ForumNotifier forum(cfg, http);
    REQUIRE_FALSE(forum.notify("hello"));
    REQUIRE(http.requests().empty());
}
