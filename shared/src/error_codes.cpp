#include "clipferry/error_codes.hpp"

#include <array>

namespace clipferry
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 10> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidReference, "invalid_reference"},
            {ErrorCode::MetadataFetchError, "metadata_fetch_error"},
            {ErrorCode::NoStreamsAvailable, "no_streams_available"},
            {ErrorCode::UnknownSelector, "unknown_selector"},
            {ErrorCode::SizeLimitExceeded, "size_limit_exceeded"},
            {ErrorCode::DownloadError, "download_error"},
            {ErrorCode::TranscodeError, "transcode_error"},
            {ErrorCode::DeliveryError, "delivery_error"},
            {ErrorCode::InternalError, "internal_error"},
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

} // namespace clipferry
