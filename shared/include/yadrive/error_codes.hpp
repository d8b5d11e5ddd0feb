/**
 * yadrive - Error taxonomy shared by the transport and client layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace yadrive
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        NotFound = 1,
        AlreadyExists = 2,
        UploadCollision = 3,
        TransferFailure = 4,
        NotFoundLocally = 5,
        Timeout = 6,
        TransportError = 7,
        InvalidResponse = 8,
        LocalIo = 9,
        InvalidArgument = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // HTTP 429 and 5xx, plus failures below HTTP (status 0).
    constexpr bool is_transient_status(long status) noexcept
    {
        return status == 0 || status == 429 || status >= 500;
    }

} // namespace yadrive
