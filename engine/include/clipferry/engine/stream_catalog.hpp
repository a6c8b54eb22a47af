#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "clipferry/engine/media.hpp"
#include "clipferry/engine/media_source.hpp"
#include "clipferry/error_codes.hpp"

namespace clipferry::engine
{

    // Numeric height of a label such as "1080p" or "720p60"; 0 when the label carries none.
    int resolution_rank(std::string_view tag) noexcept;

    // Resolution descending, then fps descending (absent last), then size descending.
    // Equal keys keep provider order.
    void order_progressive(std::vector<StreamDescriptor> &streams);

    // First descriptor in listing order whose tag matches, or nullptr.
    const StreamDescriptor *find_by_tag(const std::vector<StreamDescriptor> &catalog, std::string_view tag) noexcept;

    // One line per descriptor: "1. 1080p @30fps (60.00 MB) - /res_1080p".
    std::string format_listing(const std::vector<StreamDescriptor> &catalog);

    class StreamCatalog
    {
    public:
        StreamCatalog(MediaSource &source, std::string progressive_container);

        Result<MediaRef> resolve_media(const std::string &reference) const;

        // Fails with NoStreamsAvailable when nothing progressive remains after filtering.
        Result<std::vector<StreamDescriptor>> list_progressive_video(const MediaRef &media) const;

        // Provider order; the first entry is the automatic pick.
        Result<std::vector<StreamDescriptor>> list_audio_only(const MediaRef &media) const;

    private:
        MediaSource &source_;
        std::string progressive_container_;
    };

} // namespace clipferry::engine
