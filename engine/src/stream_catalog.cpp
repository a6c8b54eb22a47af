#include "clipferry/engine/stream_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include <spdlog/spdlog.h>

#include "clipferry/engine/size_gate.hpp"

namespace clipferry::engine
{

    namespace
    {

        bool ranks_before(const StreamDescriptor &lhs, const StreamDescriptor &rhs)
        {
            const auto lhs_rank = resolution_rank(lhs.resolution_tag);
            const auto rhs_rank = resolution_rank(rhs.resolution_tag);
            if (lhs_rank != rhs_rank)
            {
                return lhs_rank > rhs_rank;
            }
            const auto lhs_fps = lhs.fps.value_or(-1);
            const auto rhs_fps = rhs.fps.value_or(-1);
            if (lhs_fps != rhs_fps)
            {
                return lhs_fps > rhs_fps;
            }
            return lhs.size_bytes > rhs.size_bytes;
        }

        std::string display_tag(const StreamDescriptor &descriptor)
        {
            return descriptor.resolution_tag.empty() ? std::string{"Unknown"} : descriptor.resolution_tag;
        }

        Failure as_resolution_failure(const Failure &failure)
        {
            if (failure.code == ErrorCode::InvalidReference || failure.code == ErrorCode::MetadataFetchError)
            {
                return failure;
            }
            return make_failure(ErrorCode::MetadataFetchError, failure.message);
        }

    } // namespace

    int resolution_rank(std::string_view tag) noexcept
    {
        int rank = 0;
        for (const char ch : tag)
        {
            if (!std::isdigit(static_cast<unsigned char>(ch)))
            {
                break;
            }
            if (rank > 100000)
            {
                break;
            }
            rank = rank * 10 + (ch - '0');
        }
        return rank;
    }

    void order_progressive(std::vector<StreamDescriptor> &streams)
    {
        std::stable_sort(streams.begin(), streams.end(), ranks_before);
    }

    const StreamDescriptor *find_by_tag(const std::vector<StreamDescriptor> &catalog, std::string_view tag) noexcept
    {
        const auto it = std::find_if(catalog.begin(), catalog.end(),
                                     [tag](const StreamDescriptor &descriptor)
                                     { return descriptor.resolution_tag == tag; });
        return it == catalog.end() ? nullptr : &*it;
    }

    std::string format_listing(const std::vector<StreamDescriptor> &catalog)
    {
        std::string listing;
        std::size_t index = 1;
        for (const auto &descriptor : catalog)
        {
            if (!listing.empty())
            {
                listing += '\n';
            }
            const auto tag = display_tag(descriptor);
            if (descriptor.fps)
            {
                listing += spdlog::fmt_lib::format("{}. {} @{}fps ({}) - /res_{}", index, tag, *descriptor.fps,
                                                   format_megabytes(descriptor.size_bytes), tag);
            }
            else
            {
                listing += spdlog::fmt_lib::format("{}. {} ({}) - /res_{}", index, tag,
                                                   format_megabytes(descriptor.size_bytes), tag);
            }
            ++index;
        }
        return listing;
    }

    StreamCatalog::StreamCatalog(MediaSource &source, std::string progressive_container)
        : source_(source), progressive_container_(std::move(progressive_container)) {}

    Result<MediaRef> StreamCatalog::resolve_media(const std::string &reference) const
    {
        if (reference.empty())
        {
            return make_failure(ErrorCode::InvalidReference, "empty reference");
        }
        auto resolved = source_.resolve(reference);
        if (!resolved)
        {
            return as_resolution_failure(resolved.failure());
        }
        spdlog::debug("Resolved {} as \"{}\" with {} streams", reference, resolved.value().title,
                      resolved.value().streams.size());
        return resolved;
    }

    Result<std::vector<StreamDescriptor>> StreamCatalog::list_progressive_video(const MediaRef &media) const
    {
        auto streams = source_.enumerate(media);
        if (!streams)
        {
            return make_failure(ErrorCode::MetadataFetchError, streams.failure().message);
        }

        std::vector<StreamDescriptor> catalog;
        for (const auto &descriptor : streams.value())
        {
            if (descriptor.kind != StreamKind::VideoProgressive)
            {
                continue;
            }
            if (!progressive_container_.empty() && descriptor.container != progressive_container_)
            {
                continue;
            }
            catalog.push_back(descriptor);
        }
        if (catalog.empty())
        {
            return make_failure(ErrorCode::NoStreamsAvailable, "No MP4 video streams available for this video.");
        }
        order_progressive(catalog);
        return catalog;
    }

    Result<std::vector<StreamDescriptor>> StreamCatalog::list_audio_only(const MediaRef &media) const
    {
        auto streams = source_.enumerate(media);
        if (!streams)
        {
            return make_failure(ErrorCode::MetadataFetchError, streams.failure().message);
        }

        std::vector<StreamDescriptor> audio;
        std::copy_if(streams.value().begin(), streams.value().end(), std::back_inserter(audio),
                     [](const StreamDescriptor &descriptor)
                     { return descriptor.kind == StreamKind::AudioOnly; });
        if (audio.empty())
        {
            return make_failure(ErrorCode::NoStreamsAvailable, "No audio stream available.");
        }
        return audio;
    }

} // namespace clipferry::engine
