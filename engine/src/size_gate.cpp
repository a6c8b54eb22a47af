#include "clipferry/engine/size_gate.hpp"

#include <spdlog/spdlog.h>

namespace clipferry::engine
{

    double to_megabytes(std::uint64_t bytes) noexcept
    {
        return static_cast<double>(bytes) / (1024.0 * 1024.0);
    }

    std::string format_megabytes(std::uint64_t bytes)
    {
        return spdlog::fmt_lib::format("{:.2f} MB", to_megabytes(bytes));
    }

    std::string describe_rejection(std::uint64_t size_bytes, std::uint64_t limit_bytes)
    {
        const auto admission = admit(size_bytes, limit_bytes);
        return spdlog::fmt_lib::format("File size ({}) exceeds the {} delivery limit by {}.",
                                       format_megabytes(size_bytes), format_megabytes(limit_bytes),
                                       format_megabytes(admission.overage_bytes));
    }

} // namespace clipferry::engine
