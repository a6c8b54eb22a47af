/**
 * ClipFerry - Error taxonomy and result values shared by the engine and its adapters.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace clipferry
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidReference = 1,
        MetadataFetchError = 2,
        NoStreamsAvailable = 3,
        UnknownSelector = 4,
        SizeLimitExceeded = 5,
        DownloadError = 6,
        TranscodeError = 7,
        DeliveryError = 8,
        InternalError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    struct Failure
    {
        ErrorCode code{ErrorCode::InternalError};
        std::string message;
    };

    template <typename T>
    class Result
    {
    public:
        Result(T value) : storage_(std::move(value)) {}
        Result(Failure failure) : storage_(std::move(failure)) {}

        bool ok() const noexcept { return std::holds_alternative<T>(storage_); }
        explicit operator bool() const noexcept { return ok(); }

        T &value() & { return std::get<T>(storage_); }
        const T &value() const & { return std::get<T>(storage_); }
        T &&value() && { return std::get<T>(std::move(storage_)); }

        const Failure &failure() const { return std::get<Failure>(storage_); }
        ErrorCode code() const noexcept { return ok() ? ErrorCode::Ok : std::get<Failure>(storage_).code; }

    private:
        std::variant<T, Failure> storage_;
    };

    using Status = Result<std::monostate>;

    inline Status ok_status()
    {
        return Status{std::monostate{}};
    }

    inline Failure make_failure(ErrorCode code, std::string message)
    {
        return Failure{code, std::move(message)};
    }

} // namespace clipferry
