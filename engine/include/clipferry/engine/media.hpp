#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clipferry::engine
{

    enum class StreamKind : std::uint8_t
    {
        VideoProgressive,
        AudioOnly,
        Other
    };

    std::string_view to_string(StreamKind kind) noexcept;

    struct StreamDescriptor
    {
        std::string resolution_tag; // empty for audio-only
        std::optional<int> fps{};
        std::uint64_t size_bytes{};
        StreamKind kind{StreamKind::Other};
        std::string source_handle;
        std::string container;
    };

    // Opaque handle for a resolved reference. Streams are kept in provider-declared order.
    struct MediaRef
    {
        std::string reference;
        std::string title;
        std::vector<StreamDescriptor> streams;
    };

    enum class DeliveryKind : std::uint8_t
    {
        Video,
        Audio
    };

    std::string_view to_string(DeliveryKind kind) noexcept;

} // namespace clipferry::engine
