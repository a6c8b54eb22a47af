/**
 * ClipFerry - Inbound user intents and their parsing from raw message text.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace clipferry
{

    enum class IntentKind : std::uint8_t
    {
        Start,
        Text,
        SelectVideo,
        SelectAudio,
        SelectResolution,
        Cancel,
        Unknown
    };

    std::string_view to_string(IntentKind kind) noexcept;
    std::optional<IntentKind> intent_kind_from_command(std::string_view command) noexcept;

    struct Intent
    {
        IntentKind kind{IntentKind::Unknown};
        // Reference for Text, resolution tag for SelectResolution, command name for Unknown.
        std::string argument{};
    };

    // Maps a transport message to an intent. "/res_<tag>" carries the text after the last '_'
    // and a trailing "@botname" on any command is ignored.
    Intent parse_intent(std::string_view text);

} // namespace clipferry
