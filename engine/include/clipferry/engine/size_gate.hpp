#pragma once

#include <cstdint>
#include <string>

namespace clipferry::engine
{

    struct Admission
    {
        bool admitted{};
        std::uint64_t overage_bytes{};
    };

    // Sizes equal to the limit are admitted.
    constexpr Admission admit(std::uint64_t size_bytes, std::uint64_t limit_bytes) noexcept
    {
        if (size_bytes <= limit_bytes)
        {
            return Admission{true, 0};
        }
        return Admission{false, size_bytes - limit_bytes};
    }

    double to_megabytes(std::uint64_t bytes) noexcept;

    // "60.00 MB"
    std::string format_megabytes(std::uint64_t bytes);

    std::string describe_rejection(std::uint64_t size_bytes, std::uint64_t limit_bytes);

} // namespace clipferry::engine
