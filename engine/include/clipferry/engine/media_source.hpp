#pragma once

#include <string>
#include <vector>

#include "clipferry/engine/media.hpp"
#include "clipferry/error_codes.hpp"

namespace clipferry::engine
{

    class MediaSource
    {
    public:
        virtual ~MediaSource() = default;

        // Fails with InvalidReference or MetadataFetchError.
        virtual Result<MediaRef> resolve(const std::string &reference) = 0;

        // Every encoding the provider offers for a resolved reference, in provider order.
        virtual Result<std::vector<StreamDescriptor>> enumerate(const MediaRef &media) = 0;
    };

} // namespace clipferry::engine
