#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Small command line parser for long and short flags.
 *
 * Long options are accepted as `--opt value` or `--opt=value`. Only flags
 * listed in @a value_flags consume the following argument, so a boolean
 * switch never swallows a positional path. Short aliases such as `-y` map to
 * their long form and may be given as `-y file` or `-y=file`.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Values keyed by long flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags outside known_flags
    std::vector<std::string> missing_values_;    ///< Value flags given without a value
    std::set<std::string> known_flags_;
    std::set<std::string> value_flags_;
    std::map<char, std::string> short_map_;

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

    void store_with_next(const std::string& key, int argc, char* argv[], int& i) {
        if (known(key) && value_flags_.count(key)) {
            if (i + 1 < argc) {
                std::string val = argv[++i];
                store(key, &val);
            } else {
                flags_.insert(key);
                missing_values_.push_back(key);
            }
            return;
        }
        store(key, nullptr);
    }

  public:
    /**
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Accepted long flags. Empty accepts everything.
     * @param short_map Single character aliases for long flags.
     * @param value_flags Long flags that take a value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {})
        : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional) {
                positional_.push_back(arg);
            } else if (arg == "--") {
                only_positional = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    std::string val = arg.substr(eq + 1);
                    store(arg.substr(0, eq), &val);
                } else {
                    store_with_next(arg, argc, argv, i);
                }
            } else if (arg.size() == 2 && arg[0] == '-' && short_map_.count(arg[1])) {
                store_with_next(short_map_.at(arg[1]), argc, argv, i);
            } else if (arg.size() > 3 && arg[0] == '-' && arg[2] == '=' &&
                       short_map_.count(arg[1])) {
                std::string val = arg.substr(3);
                store(short_map_.at(arg[1]), &val);
            } else if (arg.size() >= 2 && arg[0] == '-') {
                unknown_flags_.push_back(arg);
            } else {
                positional_.push_back(arg);
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Value given for @a opt, or an empty string when absent.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value flags that appeared last on the command line without a value. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
