#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <string>
#include <set>
#include <vector>
#include <map>

/**
 * @brief Command line parser for the supervisor flags.
 *
 * Recognizes long options (`--flag`, `--opt value`, `--opt=value`) and short
 * aliases mapped to their long form (`-b main`, `-bmain`, stacked `-pg`).
 * Flags listed in @a switches never take a value, so a switch placed before
 * the worker command does not swallow the program name. A bare `--` ends
 * option parsing; every argument after it is positional, which is how the
 * worker command line is passed through untouched.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;    ///< Positional arguments in order
    std::vector<std::string> unknown_flags_; ///< Flags not present in known_flags
    std::set<std::string> known_flags_;      ///< Accepted flags, empty accepts all
    std::map<char, std::string> short_map_;  ///< Short to long flag mapping
    std::set<std::string> switches_;         ///< Flags that never consume a value
    bool terminated_ = false;                ///< `--` was seen

    bool known(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    void store(const std::string& key, const std::string* val) {
        if (!known(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (val)
            options_[key] = *val;
    }

    bool takes_value(const std::string& key) const { return switches_.count(key) == 0; }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Flags considered valid. If empty, all flags are
     *        treated as known.
     * @param short_map Mapping from single character options to long form.
     * @param switches Flags that never take a value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& switches = {})
        : known_flags_(known_flags), short_map_(short_map), switches_(switches) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (terminated_) {
                positional_.push_back(arg);
            } else if (arg == "--") {
                terminated_ = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    std::string val = arg.substr(eq + 1);
                    store(arg.substr(0, eq), &val);
                } else if (takes_value(arg) && i + 1 < argc &&
                           std::string(argv[i + 1]).rfind('-', 0) != 0) {
                    std::string val = argv[++i];
                    store(arg, &val);
                } else {
                    store(arg, nullptr);
                }
            } else if (arg.size() >= 2 && arg[0] == '-') {
                parse_short(arg, argc, argv, i);
            } else {
                positional_.push_back(arg);
            }
        }
    }

    /** @return `true` if @p flag (including the leading `--`) was provided. */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /** @return Value of @p opt or an empty string when missing. */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return `true` if a `--` separator ended option parsing. */
    bool terminated() const { return terminated_; }

  private:
    void parse_short(const std::string& arg, int argc, char* argv[], int& i) {
        size_t eq = arg.find('=');
        std::string letters = arg.substr(1, eq != std::string::npos ? eq - 1 : std::string::npos);
        std::string after = eq != std::string::npos ? arg.substr(eq + 1) : "";
        for (size_t j = 0; j < letters.size(); ++j) {
            auto it = short_map_.find(letters[j]);
            if (it == short_map_.end()) {
                unknown_flags_.push_back("-" + std::string(1, letters[j]));
                return;
            }
            const std::string& key = it->second;
            if (!takes_value(key)) {
                store(key, nullptr);
                continue;
            }
            // A value-taking letter consumes the rest of the token, the
            // `=value` part, or the next argument.
            std::string val;
            if (j + 1 < letters.size())
                val = letters.substr(j + 1);
            else if (!after.empty())
                val = after;
            else if (i + 1 < argc && std::string(argv[i + 1]).rfind('-', 0) != 0)
                val = argv[++i];
            if (val.empty())
                store(key, nullptr);
            else
                store(key, &val);
            return;
        }
    }
};

#endif // ARG_PARSER_HPP
