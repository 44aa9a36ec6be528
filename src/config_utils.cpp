#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    // Scalars stay verbatim; boolean interpretation belongs to the policy resolver.
    try {
        out = node.as<std::string>();
        return true;
    } catch (const YAML::Exception&) {
        return false;
    }
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      BranchSettings& branches, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (key_name == "branches") {
                if (node.IsNull())
                    continue;
                if (!node.IsMap()) {
                    error = "'branches' must be a map";
                    return false;
                }
                for (auto br = node.begin(); br != node.end(); ++br) {
                    if (!br->first.IsScalar())
                        continue;
                    auto& m = branches[br->first.as<std::string>()];
                    const YAML::Node& branch_node = br->second;
                    if (branch_node.IsNull())
                        continue;
                    if (!branch_node.IsMap()) {
                        error = "Branch '" + br->first.as<std::string>() + "' must be a map";
                        return false;
                    }
                    for (auto kv = branch_node.begin(); kv != branch_node.end(); ++kv) {
                        if (!kv->first.IsScalar())
                            continue;
                        std::string s;
                        if (to_string_value(kv->second, s))
                            m[kv->first.as<std::string>()] = s;
                    }
                }
            } else {
                std::string s;
                if (to_string_value(node, s))
                    opts["--" + key_name] = s;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      BranchSettings& branches, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            const std::string key_name = it.key();
            if (key_name == "branches") {
                if (val.is_null())
                    continue;
                if (!val.is_object()) {
                    error = "'branches' must be an object";
                    return false;
                }
                for (auto br = val.begin(); br != val.end(); ++br) {
                    auto& m = branches[br.key()];
                    const auto& branch_node = br.value();
                    if (branch_node.is_null())
                        continue;
                    if (!branch_node.is_object()) {
                        error = "Branch '" + br.key() + "' must be an object";
                        return false;
                    }
                    for (auto kv = branch_node.begin(); kv != branch_node.end(); ++kv) {
                        std::string s;
                        if (to_string_value(kv.value(), s))
                            m[kv.key()] = s;
                    }
                }
            } else {
                std::string s;
                if (to_string_value(val, s))
                    opts["--" + key_name] = s;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_config_file(const std::string& path, std::map<std::string, std::string>& opts,
                      BranchSettings& branches, std::string& error) {
    std::string ext;
    auto pos = path.find_last_of('.');
    if (pos != std::string::npos)
        ext = path.substr(pos + 1);
    for (auto& c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (ext == "json")
        return load_json_config(path, opts, branches, error);
    return load_yaml_config(path, opts, branches, error);
}
