#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace rlevel {

// ── Error codes ───────────────────────────────────────────────────────────────
//
// Every failure surfaced by the façade carries one of these codes in the
// "rlevel" error category.  Engine errors keep the engine's own message text.

enum class Errc {
    invalid_argument   = 1,  // bad call-site input (empty location, ...)
    invalid_state      = 2,  // database not open, resource already closed
    not_found          = 3,  // reserved: point reads return std::nullopt instead
    engine_failure     = 4,  // opaque failure reported by the storage engine
    protocol_violation = 5,  // update feed sequence gap
};

[[nodiscard]] const std::error_category& error_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

// ── Error ─────────────────────────────────────────────────────────────────────
//
// Exception type thrown by all façade operations.  Synchronous validation
// failures are thrown from the call itself; asynchronous failures are thrown
// when the returned awaitable is co_awaited.

class Error : public std::runtime_error {
public:
    Error(Errc code, const std::string& message);

    [[nodiscard]] const std::error_code& code() const noexcept { return code_; }

    [[nodiscard]] bool is(Errc e) const noexcept {
        return code_ == make_error_code(e);
    }

private:
    std::error_code code_;
};

// Shorthands for the errors raised in many places.
[[nodiscard]] Error not_open_error();
[[nodiscard]] Error engine_error(const std::string& what);

} // namespace rlevel

template <>
struct std::is_error_code_enum<rlevel::Errc> : std::true_type {};
