#include <uuidkit/cli.hpp>
#include <uuidkit/log.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <ostream>

namespace fs = std::filesystem;

namespace uuidkit::cli {

namespace {

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> format;
    bool upper = false;
    std::optional<int> count;
    bool verbose = false;
    bool help = false;
    std::vector<std::string> positional;
};

Result<int> parse_count(const std::string& text) {
    char* end = nullptr;
    long n = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || n < 1 || n > kMaxGenerateCount) {
        return UuidError(UuidError::InvalidArg, "invalid count: " + text,
            "-n takes an integer between 1 and " + std::to_string(kMaxGenerateCount));
    }
    return Result<int>::ok(static_cast<int>(n));
}

Result<Options> parse_options(const std::vector<std::string>& args) {
    Options opts;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto next = [&](const char* flag) -> Result<std::string> {
            if (i + 1 >= args.size()) {
                return UuidError(UuidError::InvalidArg,
                    std::string(flag) + " requires an argument");
            }
            return Result<std::string>::ok(args[++i]);
        };

        if (a == "-h" || a == "--help") {
            opts.help = true;
        } else if (a == "-v" || a == "--verbose") {
            opts.verbose = true;
        } else if (a == "-u" || a == "--upper") {
            opts.upper = true;
        } else if (a == "--config") {
            UUIDKIT_TRY_ASSIGN(opts.config_path, next("--config"));
        } else if (a == "--format") {
            UUIDKIT_TRY_ASSIGN(std::string f, next("--format"));
            if (!is_output_format(f)) {
                return UuidError(UuidError::InvalidArg, "unknown format: " + f,
                    "use canonical, hex, urn or braced");
            }
            opts.format = f;
        } else if (a == "-n" || a == "--count") {
            UUIDKIT_TRY_ASSIGN(std::string n, next("-n"));
            UUIDKIT_TRY_ASSIGN(opts.count, parse_count(n));
        } else if (a.size() > 1 && a[0] == '-' && opts.positional.empty()) {
            return UuidError(UuidError::InvalidArg, "unknown option: " + a);
        } else {
            // Everything after the command is an operand, even if it
            // starts with '-' ("-{123e...}" is valid parser input).
            opts.positional.push_back(a);
        }
    }
    return Result<Options>::ok(std::move(opts));
}

Result<Config> load_config(const Options& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        UUIDKIT_TRY_ASSIGN(global, Config::load(global_path));
    }

    std::optional<Config> local;
    if (opts.config_path) {
        UUIDKIT_TRY_ASSIGN(local, Config::load(*opts.config_path));
    }

    Config cfg = Config::effective(global, local);
    if (opts.format) {
        cfg.output.format = *opts.format;
        cfg.format_set = true;
    }
    if (opts.upper) {
        cfg.output.uppercase = true;
        cfg.uppercase_set = true;
    }
    if (opts.count) {
        cfg.generate.count = *opts.count;
        cfg.count_set = true;
    }
    return Result<Config>::ok(std::move(cfg));
}

Status emit(const Result<Uuid>& r, const OutputConfig& output, std::ostream& out) {
    if (r.is_err()) return r.error();
    out << render(r.value(), output) << "\n";
    return ok_status();
}

Status cmd_random(const Config& cfg, std::ostream& out) {
    for (int i = 0; i < cfg.generate.count; ++i) {
        UUIDKIT_TRY(emit(Uuid::v4(), cfg.output, out));
    }
    return ok_status();
}

Status cmd_name_based(int version, const std::string& ns_name,
                      const std::string& name, const Config& cfg, std::ostream& out) {
    UUIDKIT_TRY_ASSIGN(Uuid ns, resolve_namespace(ns_name));
    log::debug("v%d in namespace %s for \"%s\"", version, ns.to_string().c_str(), name.c_str());
    Uuid u = version == 3 ? Uuid::v3(ns, name) : Uuid::v5(ns, name);
    return emit(Result<Uuid>::ok(u), cfg.output, out);
}

Status cmd_parse(const std::vector<std::string>& inputs, const Config& cfg, std::ostream& out) {
    for (const auto& text : inputs) {
        UUIDKIT_TRY_ASSIGN(Uuid u, Uuid::parse(text));
        out << render(u, cfg.output)
            << "\tversion=" << u.version()
            << "\tvariant=" << variant_name(u.variant()) << "\n";
    }
    return ok_status();
}

UuidError usage_error(const std::string& msg) {
    return UuidError(UuidError::InvalidArg, msg, "run 'uuidkit --help' for usage");
}

} // namespace

const char* variant_name(Uuid::Variant v) {
    switch (v) {
        case Uuid::VariantNCS:            return "NCS";
        case Uuid::VariantRFC4122:        return "RFC4122";
        case Uuid::VariantMicrosoft:      return "Microsoft";
        case Uuid::VariantFutureReserved: return "FutureReserved";
    }
    return "Unknown";
}

std::string render(const Uuid& uuid, const OutputConfig& output) {
    std::string text = output.format == "hex" ? uuid.to_hex() : uuid.to_string();
    if (output.uppercase) {
        for (auto& c : text) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    if (output.format == "urn") return "urn:uuid:" + text;
    if (output.format == "braced") return "{" + text + "}";
    return text;
}

std::string usage() {
    return
        "usage: uuidkit [options] <command> [args]\n"
        "\n"
        "commands:\n"
        "  v4                      random UUID\n"
        "  v3 <namespace> <name>   name-based UUID (MD5)\n"
        "  v5 <namespace> <name>   name-based UUID (SHA-1)\n"
        "  gen [name]              generate with the configured version and namespace\n"
        "  parse <text>...         parse and print canonical form, version and variant\n"
        "  nil                     the nil UUID\n"
        "  ns <dns|url|oid|x500>   a well-known namespace UUID\n"
        "\n"
        "options:\n"
        "  --config FILE           read settings from FILE (over ~/.uuidkit/config.toml)\n"
        "  --format FMT            canonical, hex, urn or braced\n"
        "  -u, --upper             uppercase hex digits\n"
        "  -n, --count N           number of UUIDs to generate\n"
        "  -v, --verbose           debug logging\n"
        "  -h, --help              show this help\n";
}

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto parsed = parse_options(args);
    if (parsed.is_err()) {
        err << parsed.error().format() << "\n";
        return ExitUsage;
    }
    const Options& opts = parsed.value();

    if (opts.help) {
        out << usage();
        return ExitOk;
    }

    auto loaded = load_config(opts);
    if (loaded.is_err()) {
        err << loaded.error().format() << "\n";
        return ExitFailure;
    }
    const Config& cfg = loaded.value();

    if (auto lvl = log::level_from_name(cfg.log_level)) {
        log::set_level(*lvl);
    }
    if (opts.verbose) {
        log::set_level(log::Debug);
    }

    if (opts.positional.empty()) {
        err << usage_error("no command given").format() << "\n";
        return ExitUsage;
    }

    const std::string& cmd = opts.positional[0];
    std::vector<std::string> rest(opts.positional.begin() + 1, opts.positional.end());

    Status status = ok_status();
    if (cmd == "v4") {
        status = cmd_random(cfg, out);
    } else if (cmd == "v3" || cmd == "v5") {
        if (rest.size() != 2) {
            err << usage_error(cmd + " takes <namespace> <name>").format() << "\n";
            return ExitUsage;
        }
        status = cmd_name_based(cmd == "v3" ? 3 : 5, rest[0], rest[1], cfg, out);
    } else if (cmd == "gen") {
        int version = cfg.generate.version;
        if (version == 4) {
            status = cmd_random(cfg, out);
        } else if (rest.size() != 1) {
            err << usage_error("gen with version " + std::to_string(version)
                               + " takes exactly one <name>").format() << "\n";
            return ExitUsage;
        } else {
            status = cmd_name_based(version, cfg.generate.ns, rest[0], cfg, out);
        }
    } else if (cmd == "parse") {
        if (rest.empty()) {
            err << usage_error("parse takes at least one <text>").format() << "\n";
            return ExitUsage;
        }
        status = cmd_parse(rest, cfg, out);
    } else if (cmd == "nil") {
        status = emit(Result<Uuid>::ok(Uuid::nil()), cfg.output, out);
    } else if (cmd == "ns") {
        if (rest.size() != 1) {
            err << usage_error("ns takes one of dns, url, oid, x500").format() << "\n";
            return ExitUsage;
        }
        status = emit(resolve_namespace(rest[0]), cfg.output, out);
    } else {
        err << usage_error("unknown command: " + cmd).format() << "\n";
        return ExitUsage;
    }

    if (status.is_err()) {
        err << status.error().format() << "\n";
        return ExitFailure;
    }
    return ExitOk;
}

} // namespace uuidkit::cli
