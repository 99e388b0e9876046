#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rlevel {

// Engine write-history position.  Every put/delete consumes one sequence.
using Sequence = uint64_t;

// ── Entry ─────────────────────────────────────────────────────────────────────
// One key/value pair produced by a scan.  `key` or `value` is left empty when
// the scan was created with keys=false / values=false.

struct Entry {
    std::string key;
    std::string value;

    bool operator==(const Entry&) const = default;
};

// ── Operation ─────────────────────────────────────────────────────────────────
// One element of an atomic batch.

enum class OpType : uint8_t {
    Put = 1,
    Del = 2,
};

struct Operation {
    OpType      type = OpType::Put;
    std::string key;
    std::string value;  // Put only

    static Operation put(std::string key, std::string value) {
        return {OpType::Put, std::move(key), std::move(value)};
    }
    static Operation del(std::string key) {
        return {OpType::Del, std::move(key), {}};
    }
};

// ── Change feed types ─────────────────────────────────────────────────────────

struct UpdateRow {
    OpType      type = OpType::Put;
    std::string key;
    std::string value;

    bool operator==(const UpdateRow&) const = default;
};

// One engine write batch.  It occupies sequences [sequence, sequence + count).
// A default-constructed batch (no rows, sequence unset) marks a closed feed.
struct UpdateBatch {
    std::vector<UpdateRow>  rows;
    std::optional<Sequence> sequence;
    uint64_t                count = 0;
    std::string             data;  // raw write-batch bytes when requested

    [[nodiscard]] bool empty() const noexcept { return !sequence.has_value(); }
};

// ── WAL introspection ─────────────────────────────────────────────────────────

enum class WalFileType : uint8_t {
    Archived = 0,
    Alive    = 1,
};

struct WalFile {
    std::string path;            // relative to the database directory
    uint64_t    log_number = 0;
    WalFileType type       = WalFileType::Alive;
    Sequence    start_sequence = 0;
    uint64_t    size_bytes = 0;
};

} // namespace rlevel
