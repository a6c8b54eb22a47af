#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "clipferry/engine/config.hpp"
#include "clipferry/engine/download_orchestrator.hpp"
#include "clipferry/engine/scratch_space.hpp"
#include "clipferry/engine/session.hpp"
#include "clipferry/engine/session_registry.hpp"
#include "clipferry/engine/stream_catalog.hpp"
#include "clipferry/engine/transport.hpp"
#include "clipferry/error_codes.hpp"
#include "clipferry/intent.hpp"

namespace clipferry::engine
{

    struct EngineServices
    {
        StreamCatalog &catalog;
        DownloadOrchestrator &orchestrator;
        ScratchSpace &scratch;
        Outbox &outbox;
    };

    bool accepts(SessionState state, IntentKind kind) noexcept;

    SessionState state_after_failure(SessionState from, ErrorCode code) noexcept;

    // Reply text for a failure, worded for the state the session moves to.
    std::string reply_for(const Failure &failure, SessionState next = SessionState::AwaitingUrl);

    std::string guidance_for(SessionState state);

    // Drives every session through AWAITING_URL -> AWAITING_FORMAT -> AWAITING_RESOLUTION.
    // handle() may be called from many threads; intents for one session are serialized.
    class ConversationEngine
    {
    public:
        ConversationEngine(EngineServices services, EngineConfig config);

        void handle(const std::string &session_id, const Intent &intent);

        // Empty once the session is back in AWAITING_URL with nothing in flight.
        std::optional<Session> snapshot(const std::string &session_id) const;

        std::size_t active_sessions() const;

    private:
        void dispatch(Session &session, const Intent &intent);

        void on_start(Session &session);
        void on_cancel(Session &session);
        void on_reference(Session &session, const std::string &reference);
        void on_select_video(Session &session);
        void on_select_resolution(Session &session, const std::string &tag);
        void on_select_audio(Session &session);
        void reject(const Session &session, const Intent &intent);

        void fail(Session &session, const Failure &failure);
        void finish(Session &session);
        void discard_scratch(const Session &session) noexcept;
        void reply(const Session &session, const std::string &text) noexcept;

        EngineServices services_;
        EngineConfig config_;
        SessionRegistry sessions_;
    };

} // namespace clipferry::engine
