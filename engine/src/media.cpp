#include "clipferry/engine/media.hpp"

namespace clipferry::engine
{

    std::string_view to_string(StreamKind kind) noexcept
    {
        switch (kind)
        {
        case StreamKind::VideoProgressive:
            return "video_progressive";
        case StreamKind::AudioOnly:
            return "audio_only";
        case StreamKind::Other:
            break;
        }
        return "other";
    }

    std::string_view to_string(DeliveryKind kind) noexcept
    {
        return kind == DeliveryKind::Video ? "video" : "audio";
    }

} // namespace clipferry::engine
