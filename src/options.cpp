#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

namespace {

const std::set<std::string> kKnownFlags{
    "--repo",          "--remote",          "--branch",         "--worker",
    "--restart-delay", "--use-credentials", "--credential-file", "--ssh-public-key",
    "--ssh-private-key", "--log-file",      "--log-level",      "--verbose",
    "--max-log-size",  "--log-files",       "--compress-logs",  "--json-log",
    "--syslog",        "--syslog-facility", "--config-yaml",    "--config-json",
    "--help",          "--version"};

const std::map<char, std::string> kShortFlags{
    {'r', "--repo"},      {'b', "--branch"},  {'d', "--restart-delay"},
    {'p', "--use-credentials"}, {'l', "--log-file"}, {'L', "--log-level"},
    {'g', "--verbose"},   {'y', "--config-yaml"}, {'j', "--config-json"},
    {'h', "--help"},      {'V', "--version"}};

const std::set<std::string> kSwitches{"--use-credentials", "--verbose", "--compress-logs",
                                      "--json-log",        "--syslog",  "--help",
                                      "--version"};

// Options that only make sense on the command line.
const std::set<std::string> kCliOnly{"--config-yaml", "--config-json", "--help", "--version"};

void load_config_file(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                      fs::path& config_file) {
    ArgParser pre(argc, argv, {"--config-yaml", "--config-json"},
                  {{'y', "--config-yaml"}, {'j', "--config-json"}}, kSwitches);
    struct Loader {
        const char* flag;
        bool (*load)(const std::string&, std::map<std::string, std::string>&, std::string&);
    };
    const Loader loaders[] = {{"--config-yaml", load_yaml_config},
                              {"--config-json", load_json_config}};
    for (const auto& l : loaders) {
        if (!pre.has_flag(l.flag))
            continue;
        std::string cfg = pre.get_option(l.flag);
        if (cfg.empty())
            throw std::runtime_error(std::string(l.flag) + " requires a file");
        std::string err;
        if (!l.load(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config " + cfg + ": " + err);
        config_file = cfg;
    }
    for (const auto& kv : cfg_opts) {
        if (!kKnownFlags.count(kv.first) || kCliOnly.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }
}

} // namespace

std::vector<std::string> split_command(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> out;
    std::string word;
    while (iss >> word)
        out.push_back(word);
    return out;
}

Options parse_options(int argc, char* argv[]) {
    Options opts;
    std::map<std::string, std::string> cfg_opts;
    load_config_file(argc, argv, cfg_opts, opts.config_file);

    ArgParser parser(argc, argv, kKnownFlags, kShortFlags, kSwitches);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.terminated() && !parser.positional().empty())
        throw std::runtime_error("Unexpected argument: " + parser.positional().front() +
                                 " (put the worker command after --)");

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        return it != cfg_opts.end() && parse_switch(it->second);
    };
    auto has = [&](const std::string& k) { return parser.has_flag(k) || cfg_opts.count(k) > 0; };
    auto flag = [&](const std::string& k) { return parser.has_flag(k) || cfg_flag(k); };
    // Command-line value first, then the configuration file.
    auto value = [&](const std::string& k) {
        if (parser.has_flag(k))
            return parser.get_option(k);
        auto it = cfg_opts.find(k);
        return it != cfg_opts.end() ? it->second : std::string();
    };
    auto required = [&](const std::string& k) {
        std::string v = value(k);
        if (v.empty())
            throw std::runtime_error(k + " requires a value");
        return v;
    };

    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");

    if (has("--repo"))
        opts.repo = required("--repo");
    if (has("--remote"))
        opts.remote_name = required("--remote");
    if (has("--branch"))
        opts.branch = required("--branch");

    if (parser.terminated()) {
        if (parser.positional().empty())
            throw std::runtime_error("Missing worker command after --");
        opts.worker_command = parser.positional();
    } else if (has("--worker")) {
        opts.worker_command = split_command(required("--worker"));
        if (opts.worker_command.empty())
            throw std::runtime_error("--worker requires a command");
    }

    bool ok = false;
    if (has("--restart-delay")) {
        opts.restart_delay = parse_time_ms(required("--restart-delay"), ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --restart-delay");
    }

    opts.use_credentials = flag("--use-credentials");
    if (has("--credential-file"))
        opts.credential_file = required("--credential-file");
    if (has("--ssh-public-key"))
        opts.ssh_public_key = required("--ssh-public-key");
    if (has("--ssh-private-key"))
        opts.ssh_private_key = required("--ssh-private-key");
    if (!opts.credential_file.empty() || !opts.ssh_private_key.empty())
        opts.use_credentials = true;

    LoggingOptions& log = opts.logging;
    if (has("--log-file"))
        log.log_file = required("--log-file");
    if (has("--log-level") && !parse_log_level(required("--log-level"), log.log_level))
        throw std::runtime_error("Invalid log level: " + value("--log-level"));
    if (flag("--verbose"))
        log.log_level = LogLevel::DEBUG;
    if (has("--max-log-size")) {
        log.max_log_size = parse_bytes(required("--max-log-size"), 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (has("--log-files")) {
        log.max_log_files = parse_size_t(required("--log-files"), 0, 1000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --log-files");
    }
    log.compress_logs = flag("--compress-logs");
    log.json_log = flag("--json-log");
    log.use_syslog = flag("--syslog");
    if (has("--syslog-facility")) {
        log.syslog_facility = parse_int(required("--syslog-facility"), 0, 23 << 3, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --syslog-facility");
        log.use_syslog = true;
    }
    return opts;
}
