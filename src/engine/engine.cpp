#include "engine/engine.hpp"

#include "common/errors.hpp"
#include "engine/memory_engine.hpp"
#include "engine/rocksdb_engine.hpp"

#include <format>

namespace rlevel {

std::unique_ptr<Engine> make_engine(std::string_view name) {
    if (name == "rocksdb") {
        return std::make_unique<RocksDBEngine>();
    }
    if (name == "memory") {
        return std::make_unique<MemoryEngine>();
    }
    throw Error{Errc::invalid_argument,
                std::format("Unknown engine '{}' (expected rocksdb or memory)", name)};
}

} // namespace rlevel
