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
        {"--repo", "-r", "<path>", "Working tree to sync and run the worker in (default .)",
         "Basics"},
        {"--remote", "", "<name|url>", "Remote to fetch (default origin)", "Basics"},
        {"--branch", "-b", "<name>", "Branch to fetch and reset to (default main)", "Basics"},
        {"--worker", "", "<command>", "Worker command (default: python ./bot_main.py)", "Basics"},
        {"--restart-delay", "-d", "<ms|s|m>", "Pause between worker runs (default 0, max 1d)",
         "Basics"},
        {"--use-credentials", "-p", "", "Authenticate fetches", "Credentials"},
        {"--credential-file", "", "<file>", "Username and password, one per line",
         "Credentials"},
        {"--ssh-public-key", "", "<file>", "SSH public key", "Credentials"},
        {"--ssh-private-key", "", "<file>", "SSH private key", "Credentials"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--log-file", "-l", "<path>", "Write log entries to this file", "Logging"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--verbose", "-g", "", "Shorthand for --log-level DEBUG", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--log-files", "", "<n>", "Rotated log files to keep (default 1)", "Logging"},
        {"--compress-logs", "", "", "gzip rotated log files", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON", "Logging"},
        {"--syslog", "", "", "Log to syslog", "Logging"},
        {"--syslog-facility", "", "<n>", "Syslog facility", "Logging"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    os << "deployloop - keep a worker running on the latest remote commit\n";
    os << "Before each run the working tree is reset to <remote>/<branch> unless it has\n";
    os << "local changes. The worker is restarted whenever it exits.\n\n";
    os << "Usage: " << prog << " [options]\n";
    os << "       " << prog << " [options] -- <worker> [args...]\n\n";
    const std::vector<std::string> order{"Basics", "Credentials", "Config", "Logging"};
    for (const auto& cat : order) {
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
               << o->desc << "\n";
        os << "\n";
    }
}
