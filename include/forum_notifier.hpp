#ifndef FORUM_NOTIFIER_HPP
#define FORUM_NOTIFIER_HPP

#include <string>

#include "http_client.hpp"

/**
 * @brief Connection details for a XenForo style forum API.
 */
struct ForumConfig {
    std::string base_url = "https://www.redguides.com/community/api";
    std::string api_key;
    std::string api_user = "7384";
    long thread_id = 95078;

    bool complete() const {
        return !base_url.empty() && !api_key.empty() && !api_user.empty() && thread_id > 0;
    }
};

/**
 * @brief Posts replies to a forum thread.
 */
class ForumNotifier {
  public:
    ForumNotifier(ForumConfig config, HttpClient& http);

    /**
     * @brief Reply to the configured thread with @a message.
     *
     * Sends `POST <base_url>/posts/` as a form with `thread_id` and
     * `message`. An incomplete configuration skips the post.
     *
     * @return `true` when the forum accepted the post.
     */
    bool notify(const std::string& message) const;

    const ForumConfig& config() const { return config_; }

  private:
    ForumConfig config_;
    HttpClient& http_;
};

#endif // FORUM_NOTIFIER_HPP
