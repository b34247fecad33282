#pragma once
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace nf {

/**
 * @brief Read a string from a YAML map node.
 * @param n Map node (a parsed metadata table or config document).
 * @param key Key to look up.
 * @param defv Returned when the key is absent or not a scalar.
 */
inline std::string as_str(const YAML::Node& n, const std::string& key, const std::string& defv = {}) {
    if (!n || !n.IsMap() || !n[key] || !n[key].IsScalar()) return defv;
    return n[key].Scalar();
}

/**
 * @brief Read a bool; accepts only true/false scalars.
 */
inline bool as_bool_flexible(const YAML::Node& n, const std::string& key, bool defv) {
    if (!n || !n.IsMap() || !n[key] || !n[key].IsScalar()) return defv;
    // yaml-cpp's as<bool>() also takes yes/no/on/off; TOML has only these two.
    const std::string& v = n[key].Scalar();
    if (v == "true") return true;
    if (v == "false") return false;
    return defv;
}

/**
 * @brief Read a list of strings. A single scalar becomes a one-element list;
 * non-scalar elements are skipped.
 */
inline std::vector<std::string> as_str_list(const YAML::Node& n, const std::string& key) {
    std::vector<std::string> out;
    if (!n || !n.IsMap() || !n[key]) return out;
    const YAML::Node v = n[key];
    if (v.IsScalar()) {
        out.push_back(v.Scalar());
    } else if (v.IsSequence()) {
        for (const auto& item : v) {
            if (item.IsScalar()) out.push_back(item.Scalar());
        }
    }
    return out;
}

} // namespace nf
