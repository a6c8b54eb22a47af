#include "clipferry/engine/conversation_engine.hpp"

#include <spdlog/spdlog.h>

namespace clipferry::engine
{

    namespace
    {
        constexpr auto kWelcome = "Welcome to the media downloader bot! Send a video URL to begin.";
        constexpr auto kCancelled = "Operation cancelled. Use /start to begin again.";
    } // namespace

    ConversationEngine::ConversationEngine(EngineServices services, EngineConfig config)
        : services_(services), config_(std::move(config)) {}

    void ConversationEngine::handle(const std::string &session_id, const Intent &intent)
    {
        {
            auto lease = sessions_.acquire(session_id);
            auto &session = lease.session();
            const auto before = session.state;
            spdlog::debug("{} [{}] <- {}", session_id, to_string(before), to_string(intent.kind));

            try
            {
                dispatch(session, intent);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Intent {} for {} failed unexpectedly: {}", to_string(intent.kind), session_id, ex.what());
                session.reset();
                discard_scratch(session);
                reply(session, reply_for(make_failure(ErrorCode::InternalError, ex.what())));
            }

            if (session.state != before)
            {
                spdlog::info("{} {} -> {}", session_id, to_string(before), to_string(session.state));
            }
        }
        sessions_.release_if_idle(session_id);
    }

    std::optional<Session> ConversationEngine::snapshot(const std::string &session_id) const
    {
        return sessions_.snapshot(session_id);
    }

    std::size_t ConversationEngine::active_sessions() const
    {
        return sessions_.size();
    }

    void ConversationEngine::dispatch(Session &session, const Intent &intent)
    {
        if (!accepts(session.state, intent.kind))
        {
            reject(session, intent);
            return;
        }

        switch (intent.kind)
        {
        case IntentKind::Start:
            on_start(session);
            break;
        case IntentKind::Cancel:
            on_cancel(session);
            break;
        case IntentKind::Text:
            on_reference(session, intent.argument);
            break;
        case IntentKind::SelectVideo:
            on_select_video(session);
            break;
        case IntentKind::SelectAudio:
            on_select_audio(session);
            break;
        case IntentKind::SelectResolution:
            on_select_resolution(session, intent.argument);
            break;
        case IntentKind::Unknown:
            reject(session, intent);
            break;
        }
    }

    void ConversationEngine::on_start(Session &session)
    {
        session.reset();
        discard_scratch(session);
        reply(session, kWelcome);
    }

    void ConversationEngine::on_cancel(Session &session)
    {
        session.reset();
        discard_scratch(session);
        reply(session, kCancelled);
    }

    void ConversationEngine::on_reference(Session &session, const std::string &reference)
    {
        auto resolved = services_.catalog.resolve_media(reference);
        if (!resolved)
        {
            fail(session, resolved.failure());
            return;
        }
        const auto title = resolved.value().title;
        session.enter_format(std::move(resolved).value());
        reply(session, "Got it! Video: " + title + "\nChoose format: /video (MP4) or /audio (MP3)");
    }

    void ConversationEngine::reject(const Session &session, const Intent &intent)
    {
        spdlog::debug("{} rejected {} in {}", session.id, to_string(intent.kind), to_string(session.state));
        reply(session, guidance_for(session.state));
    }

    void ConversationEngine::fail(Session &session, const Failure &failure)
    {
        const auto next = state_after_failure(session.state, failure.code);
        spdlog::warn("{} failed with {}: {}", session.id, to_string(failure.code), failure.message);
        if (next == SessionState::AwaitingUrl)
        {
            session.reset();
            discard_scratch(session);
        }
        reply(session, reply_for(failure, next));
    }

    void ConversationEngine::finish(Session &session)
    {
        session.reset();
        discard_scratch(session);
        reply(session, "Done! Send another URL or /cancel to stop.");
    }

    void ConversationEngine::discard_scratch(const Session &session) noexcept
    {
        try
        {
            const auto removed = services_.scratch.purge(services_.scratch.session_area(session.id));
            if (removed > 0)
            {
                spdlog::debug("Purged {} scratch entries for {}", removed, session.id);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Scratch purge for {} failed: {}", session.id, ex.what());
        }
    }

    void ConversationEngine::reply(const Session &session, const std::string &text) noexcept
    {
        try
        {
            services_.outbox.send_reply(session.id, text);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Reply to {} failed: {}", session.id, ex.what());
        }
    }

} // namespace clipferry::engine
