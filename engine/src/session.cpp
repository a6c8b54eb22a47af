#include "clipferry/engine/session.hpp"

namespace clipferry::engine
{

    std::string_view to_string(SessionState state) noexcept
    {
        switch (state)
        {
        case SessionState::AwaitingUrl:
            return "AWAITING_URL";
        case SessionState::AwaitingFormat:
            return "AWAITING_FORMAT";
        case SessionState::AwaitingResolution:
            return "AWAITING_RESOLUTION";
        }
        return "UNKNOWN";
    }

    void Session::reset()
    {
        state = SessionState::AwaitingUrl;
        media.reset();
        catalog.reset();
    }

    void Session::enter_format(MediaRef resolved)
    {
        state = SessionState::AwaitingFormat;
        media = std::move(resolved);
        catalog.reset();
    }

    void Session::enter_resolution(std::vector<StreamDescriptor> listing)
    {
        state = SessionState::AwaitingResolution;
        catalog = std::move(listing);
    }

    bool Session::consistent() const noexcept
    {
        const bool catalog_ok = catalog.has_value() == (state == SessionState::AwaitingResolution);
        const bool media_ok = media.has_value() == (state != SessionState::AwaitingUrl);
        return catalog_ok && media_ok;
    }

} // namespace clipferry::engine
