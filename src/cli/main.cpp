#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/tool_config.hpp"
#include "db/cursor.hpp"
#include "db/database.hpp"
#include "db/update_feed.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <format>
#include <string>
#include <vector>

namespace asio = boost::asio;

namespace {

void print_line(const std::string& line) {
    fprintf(stdout, "%s\n", line.c_str());
}

const char* wal_type_name(rlevel::WalFileType type) {
    return type == rlevel::WalFileType::Alive ? "alive" : "archived";
}

void print_wal_file(const rlevel::WalFile& file) {
    print_line(std::format("{}\tlog={}\t{}\tstart={}\tbytes={}",
        file.path, file.log_number, wal_type_name(file.type),
        file.start_sequence, file.size_bytes));
}

// Copy the range flags shared by scan and query.
void apply_range(const rlevel::ToolConfig& cfg, rlevel::IteratorOptions& options) {
    options.gt      = cfg.gt;
    options.gte     = cfg.gte;
    options.lt      = cfg.lt;
    options.lte     = cfg.lte;
    options.reverse = cfg.reverse;
}

std::vector<rlevel::Operation> parse_batch(const std::vector<std::string>& args) {
    std::vector<rlevel::Operation> ops;
    for (std::size_t i = 0; i < args.size();) {
        if (args[i] == "put") {
            ops.push_back(rlevel::Operation::put(args[i + 1], args[i + 2]));
            i += 3;
        } else {
            ops.push_back(rlevel::Operation::del(args[i + 1]));
            i += 2;
        }
    }
    return ops;
}

// ── Commands ──────────────────────────────────────────────────────────────────

asio::awaitable<int> run_scan(rlevel::Database& db, const rlevel::ToolConfig& cfg) {
    rlevel::IteratorOptions options;
    apply_range(cfg, options);
    options.limit = cfg.limit;

    auto cursor = db.iterator(options);
    std::size_t count = 0;
    while (auto entry = co_await cursor->next()) {
        print_line(std::format("{}\t{}", entry->key, entry->value));
        ++count;
    }
    co_await cursor->close();
    spdlog::debug("rlevel-cli: scanned {} entries", count);
    co_return 0;
}

asio::awaitable<int> run_query(rlevel::Database& db, const rlevel::ToolConfig& cfg) {
    rlevel::QueryOptions options;
    apply_range(cfg, options);
    if (cfg.limit != -1) {
        options.limit = cfg.limit;
    }

    const auto result = co_await db.query(options);
    for (const auto& row : result.rows) {
        print_line(std::format("{}\t{}", row.key, row.value));
    }
    print_line(std::format("# sequence={} finished={}", result.sequence, result.finished));
    co_return 0;
}

// Replays the write log from --since up to the sequence current at startup.
asio::awaitable<int> run_updates(rlevel::Database& db, const rlevel::ToolConfig& cfg) {
    const auto latest = db.sequence();

    rlevel::UpdatesOptions options;
    options.since = cfg.since.value_or(1);

    auto feed = db.updates(options);
    uint32_t batches = 0;
    while (feed->position() <= latest && batches < cfg.max_batches) {
        const auto batch = co_await feed->next();
        if (batch.empty()) {
            break;
        }
        print_line(std::format("@{} count={}", *batch.sequence, batch.count));
        for (const auto& row : batch.rows) {
            if (row.type == rlevel::OpType::Put) {
                print_line(std::format("  put\t{}\t{}", row.key, row.value));
            } else {
                print_line(std::format("  del\t{}", row.key));
            }
        }
        ++batches;
    }
    co_await feed->close();
    co_return 0;
}

asio::awaitable<int> run_wal(rlevel::Database& db) {
    for (const auto& file : co_await db.sorted_wal_files()) {
        print_wal_file(file);
    }
    const auto current = co_await db.current_wal_file();
    print_line(std::format("# current={}", current.path));
    co_return 0;
}

asio::awaitable<int> dispatch(rlevel::Database& db, const rlevel::ToolConfig& cfg) {
    rlevel::WriteOptions write_options;
    write_options.sync = cfg.sync;

    const auto& cmd  = cfg.command;
    const auto& args = cfg.args;

    if (cmd == "get") {
        const auto value = co_await db.get(args[0]);
        if (!value) {
            print_line("NOT_FOUND");
            co_return 1;
        }
        print_line(*value);
    } else if (cmd == "put") {
        co_await db.put(args[0], args[1], write_options);
        print_line("OK");
    } else if (cmd == "del") {
        co_await db.del(args[0], write_options);
        print_line("OK");
    } else if (cmd == "batch") {
        co_await db.batch(parse_batch(args), write_options);
        print_line("OK");
    } else if (cmd == "scan") {
        co_return co_await run_scan(db, cfg);
    } else if (cmd == "query") {
        co_return co_await run_query(db, cfg);
    } else if (cmd == "updates") {
        co_return co_await run_updates(db, cfg);
    } else if (cmd == "property") {
        const auto value = db.get_property(args[0]);
        if (!value) {
            print_line("NOT_FOUND");
            co_return 1;
        }
        print_line(*value);
    } else if (cmd == "wal") {
        co_return co_await run_wal(db);
    } else if (cmd == "flush-wal") {
        rlevel::FlushWalOptions options;
        options.sync = cfg.sync;
        co_await db.flush_wal(options);
        print_line("OK");
    }
    co_return 0;
}

// Opens the database, runs the command and closes the database whatever the
// command's outcome.
asio::awaitable<int> run(rlevel::Database& db, const rlevel::ToolConfig& cfg) {
    rlevel::OpenOptions open_options;
    open_options.create_if_missing = cfg.create_if_missing;
    open_options.error_if_exists   = cfg.error_if_exists;
    open_options.read_only         = cfg.read_only;
    co_await db.open(open_options);

    int code = 0;
    std::exception_ptr error;
    try {
        code = co_await dispatch(db, cfg);
    } catch (const std::exception&) {
        error = std::current_exception();
    }

    co_await db.close();
    if (error) {
        std::rethrow_exception(error);
    }
    co_return code;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    rlevel::ToolConfig cfg;
    try {
        cfg = rlevel::parse_tool_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = rlevel::parse_log_level(cfg.log_level);
    rlevel::init_default_logger(level);
    rlevel::make_db_logger(cfg.location, level);

    spdlog::debug("rlevel-cli: {} on {} ({} engine)", cfg.command, cfg.location, cfg.engine);

    // ── Run the command ──────────────────────────────────────────────────────
    asio::io_context ioc;
    int exit_code = 0;
    try {
        rlevel::Database db{ioc, cfg.location, cfg.engine};

        asio::co_spawn(ioc, run(db, cfg),
            [&exit_code](std::exception_ptr error, int code) {
                exit_code = code;
                if (!error) {
                    return;
                }
                try {
                    std::rethrow_exception(error);
                } catch (const rlevel::Error& e) {
                    fprintf(stderr, "Error [%s]: %s\n", e.code().message().c_str(), e.what());
                    exit_code = 2;
                } catch (const std::exception& e) {
                    fprintf(stderr, "Error: %s\n", e.what());
                    exit_code = 2;
                }
            });

        ioc.run();
    } catch (const rlevel::Error& e) {
        fprintf(stderr, "Error [%s]: %s\n", e.code().message().c_str(), e.what());
        return 2;
    }

    return exit_code;
}
