#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace astv {

/**
 * Error - a failure description with an optional numeric code.
 *
 * Transports put a POSIX errno value in `code`; everything else leaves it 0.
 */
struct Error {
    std::string message;
    int code{0};

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }
};

template<typename T, typename E = Error>
class Result;

/**
 * Result<void, E> - success, or the error that stopped a setup call.
 *
 * Used when asking a collaborator to start something (browsing, resolving).
 * Runtime link failures are reported as connection states instead.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

} // namespace astv
