#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "clipferry/engine/media.hpp"

namespace clipferry::engine
{

    enum class SessionState : std::uint8_t
    {
        AwaitingUrl,
        AwaitingFormat,
        AwaitingResolution
    };

    std::string_view to_string(SessionState state) noexcept;

    // Conversation state of one user. The transition helpers keep media present outside
    // AwaitingUrl and the catalog present only in AwaitingResolution.
    struct Session
    {
        std::string id;
        SessionState state{SessionState::AwaitingUrl};
        std::optional<MediaRef> media{};
        std::optional<std::vector<StreamDescriptor>> catalog{};

        void reset();
        void enter_format(MediaRef resolved);
        void enter_resolution(std::vector<StreamDescriptor> listing);

        bool consistent() const noexcept;
    };

} // namespace clipferry::engine
