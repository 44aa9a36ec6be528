#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/// Branch short name -> policy key -> raw string value.
using BranchSettings = std::map<std::string, std::map<std::string, std::string>>;

/**
 * @brief Load hook settings from a YAML file.
 *
 * Top-level scalars become global options keyed `--name` (the same spelling
 * as on the command line). The `branches` map holds one map of policy keys
 * per branch short name, copied verbatim into @p branches. A branch whose
 * value is null is recorded with no keys.
 *
 * @param path     Filesystem path to the YAML file.
 * @param opts     Receives global option values.
 * @param branches Receives per-branch policy values.
 * @param error    Human-readable message on failure.
 * @return `true` on success; `false` otherwise.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      BranchSettings& branches, std::string& error);

/**
 * @brief Load hook settings from a JSON file.
 *
 * Same layout as load_yaml_config().
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      BranchSettings& branches, std::string& error);

/**
 * @brief Load a YAML or JSON file, chosen by extension (`.json` is JSON,
 * everything else YAML).
 */
bool load_config_file(const std::string& path, std::map<std::string, std::string>& opts,
                      BranchSettings& branches, std::string& error);

#endif // CONFIG_UTILS_HPP
