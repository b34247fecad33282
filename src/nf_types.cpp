#include "nf_types.hpp"

#include <sstream>

namespace nf {

std::string config_value_to_string(const ConfigValue& v) {
    if (const auto* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if (const auto* i = std::get_if<std::int64_t>(&v)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&v)) {
        std::ostringstream oss;
        oss.precision(15);
        oss << *d;
        std::string s = oss.str();
        // Keep floats recognisable as floats when they have an integral value.
        if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
        return s;
    }
    return std::get<std::string>(v);
}

} // namespace nf
