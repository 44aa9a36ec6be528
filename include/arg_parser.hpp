#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Command line argument parser for the hook.
 *
 * Recognizes long options (`--flag`, `--opt value`, `--opt=value`) and
 * single character aliases from @a short_map. Only options listed in
 * @a value_flags consume the following argument, so boolean switches placed
 * before the positional `<ref> <old> <new>` triple never swallow it. A lone
 * `--` ends option parsing. Flags outside @a known_flags are collected in
 * unknown_flags() instead of being applied.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::vector<std::string> missing_values_;    ///< Value options given without a value
    std::set<std::string> known_flags_;
    std::set<std::string> value_flags_;
    std::map<char, std::string> short_map_;

    void record(const std::string& key, const std::string* value) {
        if (!known_flags_.empty() && !known_flags_.count(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (value)
            options_[key] = *value;
    }

  public:
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::set<std::string>& value_flags = {},
              const std::map<char, std::string>& short_map = {})
        : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
        bool options_done = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (options_done) {
                positional_.push_back(arg);
                continue;
            }
            if (arg == "--") {
                options_done = true;
                continue;
            }
            std::string key;
            if (arg.rfind("--", 0) == 0) {
                key = arg;
            } else if (arg.size() >= 2 && arg[0] == '-' && short_map_.count(arg[1])) {
                key = short_map_.at(arg[1]);
                if (arg.size() > 2)
                    key += (arg[2] == '=' ? "" : "=") + arg.substr(2);
            } else {
                positional_.push_back(arg);
                continue;
            }
            size_t eq = key.find('=');
            if (eq != std::string::npos) {
                std::string val = key.substr(eq + 1);
                key = key.substr(0, eq);
                record(key, &val);
            } else if (value_flags_.count(key)) {
                if (i + 1 < argc) {
                    std::string val = argv[++i];
                    record(key, &val);
                } else {
                    missing_values_.push_back(key);
                }
            } else {
                record(key, nullptr);
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
     * @brief Retrieve the value associated with an option.
     *
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value options that appeared last with nothing after them. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
