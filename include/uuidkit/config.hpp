#pragma once

#include <uuidkit/result.hpp>
#include <uuidkit/uuid.hpp>
#include <optional>
#include <string>

namespace uuidkit {

// Upper bound on UUIDs generated by one invocation.
constexpr int kMaxGenerateCount = 1000000;

struct GenerateConfig {
    int version = 4;                 // 3, 4 or 5
    std::string ns = "dns";          // well-known name or UUID text
    int count = 1;
};

struct OutputConfig {
    std::string format = "canonical"; // canonical | hex | urn | braced
    bool uppercase = false;
};

// Settings for the uuidkit tool, read from TOML:
//
//   [generate]  version, namespace, count
//   [output]    format, uppercase
//   [log]       level
//
// Layered: the global file is overridden by a local one (--config).
struct Config {
    GenerateConfig generate;
    OutputConfig output;
    std::string log_level = "warn";

    // Track which fields were explicitly set (for merge)
    bool version_set = false;
    bool namespace_set = false;
    bool count_set = false;
    bool format_set = false;
    bool uppercase_set = false;
    bool log_level_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// "dns", "url", "oid", "x500" (any case) or anything Uuid::parse accepts.
Result<Uuid> resolve_namespace(const std::string& name);

bool is_output_format(const std::string& format);

// ~/.uuidkit/config.toml, or "" when no home directory is known.
std::string global_config_path();

} // namespace uuidkit
