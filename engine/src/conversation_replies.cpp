#include "clipferry/engine/conversation_engine.hpp"

namespace clipferry::engine
{

    bool accepts(SessionState state, IntentKind kind) noexcept
    {
        switch (kind)
        {
        case IntentKind::Start:
        case IntentKind::Cancel:
            return true;
        case IntentKind::Text:
            return state == SessionState::AwaitingUrl;
        case IntentKind::SelectVideo:
        case IntentKind::SelectAudio:
            return state == SessionState::AwaitingFormat;
        case IntentKind::SelectResolution:
            return state == SessionState::AwaitingResolution;
        case IntentKind::Unknown:
            break;
        }
        return false;
    }

    SessionState state_after_failure(SessionState from, ErrorCode code) noexcept
    {
        if (from == SessionState::AwaitingResolution &&
            (code == ErrorCode::UnknownSelector || code == ErrorCode::SizeLimitExceeded))
        {
            return SessionState::AwaitingResolution;
        }
        return SessionState::AwaitingUrl;
    }

    std::string reply_for(const Failure &failure, SessionState next)
    {
        switch (failure.code)
        {
        case ErrorCode::Ok:
            return {};
        case ErrorCode::InvalidReference:
            return "Error: Invalid URL or issue fetching video. Try again. (" + failure.message + ")";
        case ErrorCode::MetadataFetchError:
            return "Error fetching video details: " + failure.message + ". Send the URL again.";
        case ErrorCode::NoStreamsAvailable:
            return failure.message + " Send another URL.";
        case ErrorCode::UnknownSelector:
            return "No stream found for " + failure.message + ". Try another resolution.";
        case ErrorCode::SizeLimitExceeded:
            if (next == SessionState::AwaitingResolution)
            {
                return failure.message + " Choose a lower resolution or /cancel.";
            }
            return failure.message + " Send a different video URL.";
        case ErrorCode::DownloadError:
            return "Error downloading media: " + failure.message;
        case ErrorCode::TranscodeError:
            return "Error processing audio: " + failure.message;
        case ErrorCode::DeliveryError:
            return "Error sending file: " + failure.message;
        case ErrorCode::InternalError:
            break;
        }
        return "An error occurred: " + failure.message;
    }

    std::string guidance_for(SessionState state)
    {
        switch (state)
        {
        case SessionState::AwaitingUrl:
            return "Send a video URL to begin, or /cancel to stop.";
        case SessionState::AwaitingFormat:
            return "Choose format: /video (MP4) or /audio (MP3), or /cancel.";
        case SessionState::AwaitingResolution:
            return "Select a resolution from the list (e.g., /res_720p), or /cancel.";
        }
        return "Use /start to begin.";
    }

} // namespace clipferry::engine
