#include "forum_notifier.hpp"

#include <utility>

#include "logger.hpp"

ForumNotifier::ForumNotifier(ForumConfig config, HttpClient& http)
    : config_(std::move(config)), http_(http) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/')
        config_.base_url.pop_back();
}

bool ForumNotifier::notify(const std::string& message) const {
    if (!config_.complete()) {
        log_info("Forum configuration incomplete; skipping forum post.");
        return false;
    }
    std::string body = form_encode({{"thread_id", std::to_string(config_.thread_id)},
                                    {"message", message}});
    std::vector<std::string> headers{"XF-Api-Key: " + config_.api_key,
                                     "XF-Api-User: " + config_.api_user,
                                     "Accept: application/json",
                                     "Content-Type: application/x-www-form-urlencoded"};
    HttpResponse resp = http_.post(config_.base_url + "/posts/", body, headers);
    if (resp.ok()) {
        log_info("Posted forum reply successfully.");
        return true;
    }
    if (!resp.error.empty())
        log_error("Error posting forum reply", resp.error);
    else
        log_error("Failed to post forum reply: HTTP " + std::to_string(resp.status), resp.body);
    return false;
}
