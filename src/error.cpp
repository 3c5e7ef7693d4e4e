#include "embytes/error.hpp"

namespace embytes {

namespace {

class ErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override {
        return "embytes";
    }

    std::string message(int value) const override {
        switch (static_cast<Error>(value)) {
        case Error::None:
            return "success";
        case Error::OutOfCapacity:
            return "no remaining capacity in buffer";
        case Error::NoData:
            return "not enough readable data in buffer";
        case Error::InvalidJson:
            return "readable data is not a valid JSON document";
        default:
            return "unknown embytes error";
        }
    }

    std::error_condition default_error_condition(int value) const noexcept override {
        switch (static_cast<Error>(value)) {
        case Error::OutOfCapacity:
            return std::make_error_condition(std::errc::no_buffer_space);
        case Error::NoData:
            return std::make_error_condition(std::errc::resource_unavailable_try_again);
        case Error::InvalidJson:
            return std::make_error_condition(std::errc::bad_message);
        default:
            return std::error_condition(value, *this);
        }
    }
};

} // namespace

const std::error_category& error_category() noexcept {
    static const ErrorCategory category;
    return category;
}

std::error_code make_error_code(Error err) noexcept {
    return std::error_code(static_cast<int>(err), error_category());
}

namespace detail {

void throw_error(const std::error_code& ec, const char* location) {
    if (ec) {
        throw std::system_error(ec, location);
    }
}

} // namespace detail

} // namespace embytes
