#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

static std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--root", "", "<path>", "Superproject root (default: current directory)", "Basics"},
        {"--dry-run", "", "", "Reconcile and commit locally; skip pushes, PR and forum post",
         "Basics"},
        {"--no-push", "", "", "Same as --dry-run", "Basics"},
        {"--automation-branch", "", "<name>",
         "Rolling branch for pointer updates (default auto/submodule-updates)", "Publishing"},
        {"--github-repository", "", "<owner/repo>",
         "Repository for the PR when origin is not on GitHub", "Publishing"},
        {"--no-notify", "", "", "Do not post new PRs to the forum thread", "Publishing"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--http-timeout", "", "<sec>", "Hosting and forum API timeout (default 30)", "Network"},
        {"--network-timeout", "", "<sec>", "Git transport timeout", "Network"},
        {"--ssh-public-key", "", "<path>", "SSH public key for git remotes", "Network"},
        {"--ssh-private-key", "", "<path>", "SSH private key for git remotes", "Network"},
        {"--credential-file", "", "<path>", "File with username and password lines", "Network"},
        {"--log-file", "", "<path>", "Also write logs to this file", "Logging"},
        {"--log-level", "", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--verbose", "", "", "Same as --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write the log file as JSON lines", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file at this size", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Mirror logs to syslog", "Logging"},
        {"--silent", "", "", "Disable console output", "Logging"},
        {"--github-actions", "", "", "Emit GitHub Actions annotations and groups", "Logging"},
        {"--version", "-v", "", "Show program version", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    os << "autosubsync - keep submodules in sync with origin and upstream\n";
    os << "Merges upstream changes into each submodule, then opens one PR with the\n";
    os << "updated pointers when documentation changed.\n\n";
    os << "Usage: " << prog << " [<root>] [options]\n";
    os << "       " << prog << " --root <path> [options]\n\n";
    const std::vector<std::string> order{"Basics", "Publishing", "Config", "Network", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
               << o->desc << "\n";
        os << "\n";
    }
    os << "Environment: GH_API_TOKEN, GITLAB_API_TOKEN, GH_API, GL_API, XF_DONOTREPLY_KEY,\n";
    os << "XF_API_USER, XF_BASE_URL, XF_THREAD_ID, GITHUB_REPOSITORY, GITHUB_OUTPUT.\n";
}
