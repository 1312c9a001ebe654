#pragma once

#include <uuidkit/config.hpp>
#include <uuidkit/uuid.hpp>
#include <iosfwd>
#include <string>
#include <vector>

namespace uuidkit::cli {

enum ExitCode {
    ExitOk = 0,
    ExitFailure = 1,
    ExitUsage = 2
};

// Entry point of the uuidkit tool. `args` excludes the program name.
// Results go to `out`, diagnostics and formatted errors to `err`.
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

std::string render(const Uuid& uuid, const OutputConfig& output);

const char* variant_name(Uuid::Variant v);

std::string usage();

} // namespace uuidkit::cli
