#pragma once

#include "engine/options.hpp"
#include "engine/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace rlevel {

// ── RangeScanner ──────────────────────────────────────────────────────────────
//
// Applies range bounds, direction and limit on top of an engine's raw ordered
// iterator.  `Iter` must provide:
//
//   bool valid() const;
//   void seek_to_first();  void seek_to_last();
//   void seek(std::string_view target);   // first key >= target
//   void next();  void prev();
//   std::string_view key() const;  std::string_view value() const;
//   void check() const;                   // throws on iterator error
//
// Positioning is lazy: the first read seeks to the start of the range unless
// seek() was called before.

template <typename Iter>
class RangeScanner {
public:
    RangeScanner(Iter iter, const RangeOptions& range)
        : iter_(std::move(iter))
        , range_(range)
    {}

    // Seek to the first relevant key based on range options.
    void seek_to_range() {
        did_seek_ = true;

        const bool reverse = range_.reverse;
        if (!reverse && range_.gte) {
            iter_.seek(*range_.gte);
        } else if (!reverse && range_.gt) {
            iter_.seek(*range_.gt);
            if (iter_.valid() && iter_.key() == *range_.gt) {
                iter_.next();
            }
        } else if (reverse && range_.lte) {
            seek_reverse(*range_.lte, /*inclusive=*/true);
        } else if (reverse && range_.lt) {
            seek_reverse(*range_.lt, /*inclusive=*/false);
        } else if (reverse) {
            iter_.seek_to_last();
        } else {
            iter_.seek_to_first();
        }
    }

    // Reposition during iteration.  Out-of-range targets exhaust the scan.
    void seek(std::string_view target) {
        did_seek_ = true;

        if (out_of_range(target)) {
            past_end_ = true;
            return;
        }
        past_end_ = false;

        if (range_.reverse) {
            seek_reverse(target, /*inclusive=*/true);
        } else {
            iter_.seek(target);
        }
    }

    // Appends up to `max` entries.  Returns true when the scan is exhausted.
    bool read(std::size_t max, std::vector<Entry>& out, bool keys, bool values) {
        if (!did_seek_) {
            seek_to_range();
        }

        std::size_t n = 0;
        while (n < max && !exhausted()) {
            Entry entry;
            if (keys)   entry.key   = std::string(iter_.key());
            if (values) entry.value = std::string(iter_.value());
            out.push_back(std::move(entry));
            ++count_;
            ++n;
            step();
        }

        iter_.check();
        return exhausted();
    }

    [[nodiscard]] bool exhausted() const {
        if (past_end_ || !iter_.valid() || out_of_range(iter_.key())) {
            return true;
        }
        return range_.limit >= 0 && count_ >= range_.limit;
    }

    [[nodiscard]] bool out_of_range(std::string_view target) const {
        // The lte and gte options take precedence over lt and gt respectively
        if (range_.lte) {
            if (target > std::string_view{*range_.lte}) return true;
        } else if (range_.lt) {
            if (target >= std::string_view{*range_.lt}) return true;
        }

        if (range_.gte) {
            if (target < std::string_view{*range_.gte}) return true;
        } else if (range_.gt) {
            if (target <= std::string_view{*range_.gt}) return true;
        }

        return false;
    }

    Iter& iterator() noexcept { return iter_; }

private:
    // Position on the last key <= bound (inclusive) or < bound (exclusive).
    void seek_reverse(std::string_view bound, bool inclusive) {
        iter_.seek(bound);
        if (!iter_.valid()) {
            iter_.seek_to_last();
        } else {
            const auto key = iter_.key();
            if (inclusive ? key > bound : key >= bound) {
                iter_.prev();
            }
        }
    }

    void step() {
        if (range_.reverse) iter_.prev();
        else                iter_.next();
    }

    Iter         iter_;
    RangeOptions range_;
    int64_t      count_    = 0;
    bool         did_seek_ = false;
    bool         past_end_ = false;
};

} // namespace rlevel
