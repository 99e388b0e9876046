#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace rlevel {

// ── ToolConfig ────────────────────────────────────────────────────────────────
// Full configuration for one rlevel-cli invocation.
// Populated by parse_tool_config() from CLI arguments.

struct ToolConfig {
    std::string location;           // Database directory
    std::string engine;             // Storage engine: "rocksdb" (default) or "memory"
    bool        create_if_missing;  // Create the database when absent
    bool        error_if_exists;    // Refuse to open an existing database
    bool        read_only;          // Open without write access
    std::string log_level;          // spdlog level string

    std::string              command;  // get | put | del | batch | scan | query | updates | property | wal | flush-wal
    std::vector<std::string> args;     // positional arguments of the command

    // scan / query
    std::optional<std::string> gt;
    std::optional<std::string> gte;
    std::optional<std::string> lt;
    std::optional<std::string> lte;
    bool    reverse;
    int64_t limit;                  // -1 = command default

    // updates
    std::optional<uint64_t> since;
    uint32_t max_batches;           // stop after this many batches

    // put / del / batch / flush-wal
    bool sync;
};

// ── parse_tool_config ────────────────────────────────────────────────────────
// Parse CLI arguments into a ToolConfig.
//
// On success: returns a fully validated ToolConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (the help text when --help is given).
//
// Validates:
//   - location is non-empty
//   - engine is "rocksdb" or "memory"
//   - log level is known
//   - command is known and has the right number of arguments
//   - limit >= -1, max-batches > 0
//
// Batch arguments: a sequence of `put KEY VALUE` and `del KEY` groups.
//   Example: rlevel-cli --location ./db batch del a put c 3

[[nodiscard]] ToolConfig parse_tool_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with rlevel-cli options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace rlevel
