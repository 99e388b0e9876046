#include "db/chained_batch.hpp"

#include "common/errors.hpp"
#include "db/database.hpp"

namespace rlevel {

using boost::asio::awaitable;

ChainedBatch::ChainedBatch(Database& db) : db_(db) {}

void ChainedBatch::require_open() const {
    if (closed_) {
        throw Error{Errc::invalid_state, "Batch is not open: cannot use it after write() or close()"};
    }
}

ChainedBatch& ChainedBatch::put(std::string key, std::string value) {
    require_open();
    ops_.push_back(Operation::put(std::move(key), std::move(value)));
    return *this;
}

ChainedBatch& ChainedBatch::del(std::string key) {
    require_open();
    ops_.push_back(Operation::del(std::move(key)));
    return *this;
}

ChainedBatch& ChainedBatch::clear() {
    require_open();
    ops_.clear();
    return *this;
}

awaitable<void> ChainedBatch::write(WriteOptions options) {
    require_open();

    auto ops = std::move(ops_);
    dispose();

    return db_.settle(db_.write([&] {
        if (!ops.empty()) {
            db_.engine().apply(ops, options);
        }
    }));
}

awaitable<void> ChainedBatch::close() {
    dispose();
    co_return;
}

void ChainedBatch::release() noexcept {
    dispose();
}

void ChainedBatch::dispose() noexcept {
    closed_ = true;
    ops_.clear();
    detach();
}

} // namespace rlevel
