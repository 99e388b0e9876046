#include "db/resource.hpp"

#include "common/errors.hpp"

#include <exception>

namespace rlevel {

using boost::asio::awaitable;

// ── Resource ─────────────────────────────────────────────────────────────────

Resource::~Resource() {
    detach();
}

void Resource::detach() noexcept {
    if (tracker_) {
        tracker_->detach(*this);
    }
}

// ── ResourceTracker ──────────────────────────────────────────────────────────

ResourceTracker::ResourceTracker(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
{}

ResourceTracker::~ResourceTracker() {
    // Survivors must not point back into a destroyed tracker.
    for (auto& [ticket, weak] : resources_) {
        if (auto resource = weak.lock()) {
            resource->tracker_ = nullptr;
        }
    }
}

void ResourceTracker::attach(const std::shared_ptr<Resource>& resource) {
    if (closing_) {
        throw Error{Errc::invalid_state, "Database is not open"};
    }
    if (resource->tracker_) {
        return;
    }
    const auto ticket = next_ticket_++;
    resources_.emplace(ticket, resource);
    resource->tracker_ = this;
    resource->ticket_  = ticket;
}

void ResourceTracker::detach(Resource& resource) noexcept {
    if (resource.tracker_ != this) {
        return;
    }
    resources_.erase(resource.ticket_);
    resource.tracker_ = nullptr;
    resource.ticket_  = 0;
}

awaitable<void> ResourceTracker::close_all() {
    closing_ = true;

    std::size_t closed = 0;
    while (!resources_.empty()) {
        // Re-read the first entry each round: closes detach, and resources
        // created before the sweep started may still be finishing up.
        auto it = resources_.begin();
        const auto ticket = it->first;
        auto resource = it->second.lock();
        if (!resource) {
            resources_.erase(it);
            continue;
        }

        logger_->debug("Closing {} (ticket {})", resource->kind(), ticket);
        try {
            co_await resource->close();
        } catch (const std::exception& e) {
            logger_->warn("Failed to close {} (ticket {}): {}",
                          resource->kind(), ticket, e.what());
        }

        // A close that failed before detaching must not stall the sweep.
        if (resource->tracker_ == this && resource->ticket_ == ticket) {
            detach(*resource);
        }
        ++closed;
    }

    if (closed > 0) {
        logger_->debug("Closed {} resources", closed);
    }
}

void ResourceTracker::release_all() noexcept {
    closing_ = true;
    while (!resources_.empty()) {
        auto it = resources_.begin();
        auto resource = it->second.lock();
        if (!resource) {
            resources_.erase(it);
            continue;
        }
        resource->release();
        detach(*resource);
    }
}

} // namespace rlevel
