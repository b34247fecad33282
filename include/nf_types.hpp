#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>

namespace nf {
namespace fs = std::filesystem;

#if defined(_WIN32)
    #if defined(NDFLOW_LIB_BUILD)
        #define NDFLOW_API __declspec(dllexport)
    #else
        #define NDFLOW_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(NDFLOW_LIB_BUILD)
        #define NDFLOW_API __attribute__((visibility("default")))
    #else
        #define NDFLOW_API
    #endif
#endif

enum class FlowErrc {
    Unknown = 1, Syntax, Resolution, Profile, NotFound, Io,
    InvalidPipeline, StageFailed,
};
struct NDFLOW_API FlowError : public std::runtime_error {
    explicit FlowError(const std::string& what)
        : std::runtime_error(what), code_(FlowErrc::Unknown) {}
    FlowError(FlowErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    FlowErrc code() const noexcept { return code_; }
private:
    FlowErrc code_;
};

// I/O direction a plugin is invoked in. Raw is used for byte-level stages
// (protocol fetch, decompression) that sit in front of a format reader;
// Filter is records in, records out, between a reader and a writer.
enum class Mode { Read, Write, Raw, Filter };

inline const char* mode_name(Mode m) {
    switch (m) {
        case Mode::Read: return "read";
        case Mode::Write: return "write";
        case Mode::Raw: return "raw";
        case Mode::Filter: return "filter";
    }
    return "read";
}

// Scalar handed to a plugin as `--key value`.
using ConfigValue = std::variant<bool, std::int64_t, double, std::string>;
using ConfigMap = std::map<std::string, ConfigValue>;

std::string config_value_to_string(const ConfigValue& v);

} // namespace nf
