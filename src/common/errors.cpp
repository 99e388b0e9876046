#include "common/errors.hpp"

namespace rlevel {

namespace {

class RlevelCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "rlevel"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::invalid_argument:   return "invalid argument";
            case Errc::invalid_state:      return "invalid state";
            case Errc::not_found:          return "not found";
            case Errc::engine_failure:     return "engine failure";
            case Errc::protocol_violation: return "protocol violation";
        }
        return "unknown rlevel error";
    }
};

} // anonymous namespace

const std::error_category& error_category() noexcept {
    static const RlevelCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

Error::Error(Errc code, const std::string& message)
    : std::runtime_error(message)
    , code_(make_error_code(code))
{}

Error not_open_error() {
    return Error{Errc::invalid_state, "Database is not open"};
}

Error engine_error(const std::string& what) {
    return Error{Errc::engine_failure, what};
}

} // namespace rlevel
