#include "common/tool_config.hpp"

#include "common/logger.hpp"

#include <format>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace rlevel {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

template <typename T>
[[nodiscard]] std::optional<T> optional_value(const po::variables_map& vm, const char* name) {
    if (vm.count(name) == 0) {
        return std::nullopt;
    }
    return vm[name].as<T>();
}

void require_args(const ToolConfig& cfg, std::size_t count, std::string_view usage) {
    if (cfg.args.size() != count) {
        throw std::runtime_error(
            std::format("'{}' expects {} argument(s): {}", cfg.command, count, usage));
    }
}

// Batch arguments are `put KEY VALUE` and `del KEY` groups.
void validate_batch_args(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::runtime_error("'batch' expects at least one operation");
    }
    std::size_t i = 0;
    while (i < args.size()) {
        const auto& op = args[i];
        const std::size_t width = op == "put" ? 3 : op == "del" ? 2 : 0;
        if (width == 0) {
            throw std::runtime_error(
                std::format("Unknown batch operation '{}' (expected put or del)", op));
        }
        if (i + width > args.size()) {
            throw std::runtime_error(
                std::format("Incomplete batch operation '{}' at argument {}", op, i + 1));
        }
        i += width;
    }
}

// Check the fully-populated config for consistency.
void validate(const ToolConfig& cfg) {
    if (cfg.location.empty()) {
        throw std::runtime_error("--location must not be empty");
    }
    if (cfg.engine != "rocksdb" && cfg.engine != "memory") {
        throw std::runtime_error(
            std::format("Unknown engine '{}' (expected rocksdb or memory)", cfg.engine));
    }
    if (!is_log_level(cfg.log_level)) {
        throw std::runtime_error(std::format("Unknown log level '{}'", cfg.log_level));
    }
    if (cfg.limit < -1) {
        throw std::runtime_error(std::format("--limit must be >= -1, got {}", cfg.limit));
    }
    if (cfg.max_batches == 0) {
        throw std::runtime_error("--max-batches must be > 0");
    }

    const auto& cmd = cfg.command;
    if (cmd == "get" || cmd == "del") {
        require_args(cfg, 1, "KEY");
    } else if (cmd == "put") {
        require_args(cfg, 2, "KEY VALUE");
    } else if (cmd == "property") {
        require_args(cfg, 1, "NAME");
    } else if (cmd == "batch") {
        validate_batch_args(cfg.args);
    } else if (cmd == "scan" || cmd == "query" || cmd == "updates" ||
               cmd == "wal" || cmd == "flush-wal") {
        require_args(cfg, 0, "no positional arguments");
    } else {
        throw std::runtime_error(std::format("Unknown command '{}'", cmd));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("location,l",
            po::value<std::string>()->required(),
            "Database directory")
        ("engine",
            po::value<std::string>()->default_value("rocksdb"),
            "Storage engine: rocksdb (default) or memory")
        ("create-if-missing",
            po::value<bool>()->default_value(true),
            "Create the database if it does not exist")
        ("error-if-exists",
            po::bool_switch()->default_value(false),
            "Fail if the database already exists")
        ("read-only",
            po::bool_switch()->default_value(false),
            "Open the database without write access")
        ("log-level",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off")
        ("gt",  po::value<std::string>(), "scan/query: keys greater than")
        ("gte", po::value<std::string>(), "scan/query: keys greater than or equal to")
        ("lt",  po::value<std::string>(), "scan/query: keys less than")
        ("lte", po::value<std::string>(), "scan/query: keys less than or equal to")
        ("reverse",
            po::bool_switch()->default_value(false),
            "scan/query: iterate in reverse key order")
        ("limit",
            po::value<int64_t>()->default_value(-1),
            "scan/query: maximum number of entries (-1 = command default)")
        ("since",
            po::value<uint64_t>(),
            "updates: first sequence to read (default 1)")
        ("max-batches",
            po::value<uint32_t>()->default_value(100),
            "updates: stop after this many write batches")
        ("sync",
            po::bool_switch()->default_value(false),
            "put/del/batch/flush-wal: fsync the WAL")
        ("command",
            po::value<std::string>()->required(),
            "get|put|del|batch|scan|query|updates|property|wal|flush-wal")
        ("args",
            po::value<std::vector<std::string>>()->multitoken(),
            "Command arguments");
}

// ── parse_tool_config ────────────────────────────────────────────────────────

ToolConfig parse_tool_config(int argc, char* argv[]) {
    po::options_description desc("rlevel-cli options");
    add_options(desc);

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("args", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv).options(desc).positional(positional).run(),
            vm);

        // Handle --help before notify() so missing required options don't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: rlevel-cli --location DIR [options] COMMAND [ARGS...]\n" << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(std::format("Argument error: {}", e.what()));
    }

    ToolConfig cfg;
    cfg.location          = vm["location"].as<std::string>();
    cfg.engine            = vm["engine"].as<std::string>();
    cfg.create_if_missing = vm["create-if-missing"].as<bool>();
    cfg.error_if_exists   = vm["error-if-exists"].as<bool>();
    cfg.read_only         = vm["read-only"].as<bool>();
    cfg.log_level         = vm["log-level"].as<std::string>();
    cfg.command           = vm["command"].as<std::string>();
    cfg.args              = optional_value<std::vector<std::string>>(vm, "args")
                                .value_or(std::vector<std::string>{});
    cfg.gt                = optional_value<std::string>(vm, "gt");
    cfg.gte               = optional_value<std::string>(vm, "gte");
    cfg.lt                = optional_value<std::string>(vm, "lt");
    cfg.lte               = optional_value<std::string>(vm, "lte");
    cfg.reverse           = vm["reverse"].as<bool>();
    cfg.limit             = vm["limit"].as<int64_t>();
    cfg.since             = optional_value<uint64_t>(vm, "since");
    cfg.max_batches       = vm["max-batches"].as<uint32_t>();
    cfg.sync              = vm["sync"].as<bool>();

    validate(cfg);
    return cfg;
}

} // namespace rlevel
