/**
 * yadrive - Ok/Err result type returned by every remote operation.
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "yadrive/error_codes.hpp"

namespace yadrive
{

    struct Error
    {
        ErrorCode kind{ErrorCode::TransferFailure};
        long status{};
        std::string message{};
    };

    std::string describe(const Error &error);

    template <typename T>
    class Result
    {
    public:
        Result(T value) : state_(std::move(value)) {}
        Result(Error error) : state_(std::move(error)) {}

        bool ok() const noexcept { return std::holds_alternative<T>(state_); }
        explicit operator bool() const noexcept { return ok(); }

        const T &value() const &
        {
            if (!ok())
            {
                throw std::logic_error("Result holds an error: " + describe(error()));
            }
            return std::get<T>(state_);
        }

        T &value() &
        {
            if (!ok())
            {
                throw std::logic_error("Result holds an error: " + describe(error()));
            }
            return std::get<T>(state_);
        }

        T &&value() &&
        {
            if (!ok())
            {
                throw std::logic_error("Result holds an error: " + describe(error()));
            }
            return std::get<T>(std::move(state_));
        }

        const Error &error() const
        {
            return std::get<Error>(state_);
        }

    private:
        std::variant<T, Error> state_;
    };

    // Result for operations that only succeed or fail.
    class Status
    {
    public:
        Status() = default;
        Status(Error error) : error_(std::move(error)) {}

        static Status success() { return Status{}; }

        bool ok() const noexcept { return !error_.has_value(); }
        explicit operator bool() const noexcept { return ok(); }
        const Error &error() const { return *error_; }

    private:
        std::optional<Error> error_{};
    };

    inline Error make_error(ErrorCode kind, long status, std::string message)
    {
        return Error{.kind = kind, .status = status, .message = std::move(message)};
    }

} // namespace yadrive
