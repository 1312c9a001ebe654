#include <uuidkit/config.hpp>
#include <uuidkit/log.hpp>
#include <toml++/toml.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace uuidkit {

static UuidError config_error(const std::string& msg) {
    return UuidError(UuidError::Config, msg,
        "see the [generate], [output] and [log] sections of the config file");
}

static std::string to_lower(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool is_output_format(const std::string& format) {
    return format == "canonical" || format == "hex"
        || format == "urn" || format == "braced";
}

Result<Uuid> resolve_namespace(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "dns")  return Result<Uuid>::ok(Uuid::namespace_dns());
    if (lower == "url")  return Result<Uuid>::ok(Uuid::namespace_url());
    if (lower == "oid")  return Result<Uuid>::ok(Uuid::namespace_oid());
    if (lower == "x500") return Result<Uuid>::ok(Uuid::namespace_x500());

    auto parsed = Uuid::parse(name);
    if (parsed.is_err()) {
        UuidError e(UuidError::InvalidArg, "unknown namespace: " + name,
            "use dns, url, oid, x500 or a UUID");
        e.cause = std::make_shared<const UuidError>(std::move(parsed).error());
        return e;
    }
    return parsed;
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UuidError{UuidError::Config,
            std::string("config TOML parse error: ") + std::string(e.description())};
    }

    Config cfg;

    // [generate] section
    if (auto gen = doc["generate"].as_table()) {
        if (auto node = (*gen)["version"]) {
            auto v = node.value<int64_t>();
            if (!v || (*v != 3 && *v != 4 && *v != 5)) {
                return config_error("generate.version must be 3, 4 or 5");
            }
            cfg.generate.version = static_cast<int>(*v);
            cfg.version_set = true;
        }
        if (auto node = (*gen)["namespace"]) {
            auto v = node.value<std::string>();
            if (!v) return config_error("generate.namespace must be a string");
            auto ns = resolve_namespace(*v);
            if (ns.is_err()) {
                UuidError e = config_error("generate.namespace is not a namespace: " + *v);
                e.cause = std::make_shared<const UuidError>(std::move(ns).error());
                return e;
            }
            cfg.generate.ns = *v;
            cfg.namespace_set = true;
        }
        if (auto node = (*gen)["count"]) {
            auto v = node.value<int64_t>();
            if (!v || *v < 1 || *v > kMaxGenerateCount) {
                return config_error("generate.count must be between 1 and "
                                    + std::to_string(kMaxGenerateCount));
            }
            cfg.generate.count = static_cast<int>(*v);
            cfg.count_set = true;
        }
    }

    // [output] section
    if (auto out = doc["output"].as_table()) {
        if (auto node = (*out)["format"]) {
            auto v = node.value<std::string>();
            if (!v || !is_output_format(*v)) {
                return config_error("output.format must be one of canonical, hex, urn, braced");
            }
            cfg.output.format = *v;
            cfg.format_set = true;
        }
        if (auto node = (*out)["uppercase"]) {
            auto v = node.value<bool>();
            if (!v) return config_error("output.uppercase must be a boolean");
            cfg.output.uppercase = *v;
            cfg.uppercase_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = (*lg)["level"]) {
            auto v = node.value<std::string>();
            if (!v || !log::level_from_name(*v)) {
                return config_error("log.level must be trace, debug, info, warn or error");
            }
            cfg.log_level = *v;
            cfg.log_level_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return UuidError{UuidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    log::debug("loaded config %s", path.c_str());
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.version_set) {
        generate.version = other.generate.version;
        version_set = true;
    }
    if (other.namespace_set) {
        generate.ns = other.generate.ns;
        namespace_set = true;
    }
    if (other.count_set) {
        generate.count = other.generate.count;
        count_set = true;
    }
    if (other.format_set) {
        output.format = other.output.format;
        format_set = true;
    }
    if (other.uppercase_set) {
        output.uppercase = other.output.uppercase;
        uppercase_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.uuidkit/config.toml";
}

} // namespace uuidkit
