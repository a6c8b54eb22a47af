#include "clipferry/engine/conversation_engine.hpp"

#include <spdlog/spdlog.h>

#include "clipferry/engine/size_gate.hpp"

namespace clipferry::engine
{

    void ConversationEngine::on_select_audio(Session &session)
    {
        auto streams = services_.catalog.list_audio_only(*session.media);
        if (!streams)
        {
            fail(session, streams.failure());
            return;
        }

        // The provider lists its preferred audio quality first.
        const auto descriptor = streams.value().front();
        const auto admission = admit(descriptor.size_bytes, config_.size_limit_bytes);
        if (!admission.admitted)
        {
            fail(session, make_failure(ErrorCode::SizeLimitExceeded,
                                       describe_rejection(descriptor.size_bytes, config_.size_limit_bytes)));
            return;
        }

        const auto &media = *session.media;
        SessionArea area;
        try
        {
            area = services_.scratch.prepare_session_area(session.id);
        }
        catch (const ScratchError &ex)
        {
            fail(session, make_failure(ErrorCode::DownloadError, ex.what()));
            return;
        }

        auto artifact = services_.orchestrator.fetch_audio_and_transcode(area, media, descriptor);
        if (!artifact)
        {
            fail(session, artifact.failure());
            return;
        }

        spdlog::debug("Audio for {} ready ({} bytes)", session.id, artifact.value().size_bytes());
        auto delivered = services_.orchestrator.deliver(session.id, std::move(artifact).value(), media.title);
        if (!delivered)
        {
            fail(session, delivered.failure());
            return;
        }
        finish(session);
    }

} // namespace clipferry::engine
