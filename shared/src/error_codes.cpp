#include "yadrive/error_codes.hpp"
#include "yadrive/result.hpp"

#include <array>
#include <string>

namespace yadrive
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::UploadCollision, "upload_collision"},
            {ErrorCode::TransferFailure, "transfer_failure"},
            {ErrorCode::NotFoundLocally, "not_found_locally"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::TransportError, "transport_error"},
            {ErrorCode::InvalidResponse, "invalid_response"},
            {ErrorCode::LocalIo, "local_io"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::string describe(const Error &error)
    {
        std::string text(to_string(error.kind));
        if (error.status != 0)
        {
            text += " (HTTP " + std::to_string(error.status) + ")";
        }
        if (!error.message.empty())
        {
            text += ": " + error.message;
        }
        return text;
    }

} // namespace yadrive
