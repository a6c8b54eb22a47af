#include "clipferry/intent.hpp"

#include <array>
#include <cctype>

namespace clipferry
{

    namespace
    {

        struct IntentMapping
        {
            IntentKind kind;
            std::string_view label;
            std::string_view command;
        };

        constexpr std::array<IntentMapping, 7> kIntentMappings{{
            {IntentKind::Start, "START", "start"},
            {IntentKind::Text, "TEXT", ""},
            {IntentKind::SelectVideo, "SELECT_VIDEO", "video"},
            {IntentKind::SelectAudio, "SELECT_AUDIO", "audio"},
            {IntentKind::SelectResolution, "SELECT_RESOLUTION", ""},
            {IntentKind::Cancel, "CANCEL", "cancel"},
            {IntentKind::Unknown, "UNKNOWN", ""},
        }};

        constexpr std::string_view kResolutionPrefix = "res_";

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            return value;
        }

    } // namespace

    std::string_view to_string(IntentKind kind) noexcept
    {
        for (const auto &mapping : kIntentMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<IntentKind> intent_kind_from_command(std::string_view command) noexcept
    {
        for (const auto &mapping : kIntentMappings)
        {
            if (!mapping.command.empty() && mapping.command == command)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    Intent parse_intent(std::string_view text)
    {
        const auto trimmed = trim(text);
        if (trimmed.empty() || trimmed.front() != '/')
        {
            return Intent{IntentKind::Text, std::string(trimmed)};
        }

        auto command = trimmed.substr(1);
        const auto space = command.find_first_of(" \t\r\n");
        if (space != std::string_view::npos)
        {
            command = command.substr(0, space);
        }
        const auto at = command.find('@');
        if (at != std::string_view::npos)
        {
            command = command.substr(0, at);
        }

        if (command.substr(0, kResolutionPrefix.size()) == kResolutionPrefix)
        {
            const auto tag = command.substr(command.rfind('_') + 1);
            return Intent{IntentKind::SelectResolution, std::string(tag)};
        }

        if (const auto kind = intent_kind_from_command(command))
        {
            return Intent{*kind, {}};
        }
        return Intent{IntentKind::Unknown, std::string(command)};
    }

} // namespace clipferry
