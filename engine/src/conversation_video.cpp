#include "clipferry/engine/conversation_engine.hpp"

#include <spdlog/spdlog.h>

#include "clipferry/engine/size_gate.hpp"

namespace clipferry::engine
{

    void ConversationEngine::on_select_video(Session &session)
    {
        auto listing = services_.catalog.list_progressive_video(*session.media);
        if (!listing)
        {
            fail(session, listing.failure());
            return;
        }

        const auto example = listing.value().front().resolution_tag;
        auto text = "Available resolutions:\n" + format_listing(listing.value()) +
                    "\n\nSelect a resolution by typing the command (e.g., /res_" + example + ").";
        session.enter_resolution(std::move(listing).value());
        reply(session, text);
    }

    void ConversationEngine::on_select_resolution(Session &session, const std::string &tag)
    {
        const auto *match = tag.empty() ? nullptr : find_by_tag(*session.catalog, tag);
        if (match == nullptr)
        {
            fail(session, make_failure(ErrorCode::UnknownSelector, tag.empty() ? std::string{"an empty tag"} : tag));
            return;
        }

        const auto admission = admit(match->size_bytes, config_.size_limit_bytes);
        if (!admission.admitted)
        {
            fail(session, make_failure(ErrorCode::SizeLimitExceeded,
                                       describe_rejection(match->size_bytes, config_.size_limit_bytes)));
            return;
        }

        // The session keeps its catalog until the outcome is known.
        const auto descriptor = *match;
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

        auto artifact = services_.orchestrator.fetch_video(area, media, descriptor);
        if (!artifact)
        {
            fail(session, artifact.failure());
            return;
        }

        reply(session, "Downloaded " + descriptor.resolution_tag + " video! Sending...");
        auto delivered = services_.orchestrator.deliver(session.id, std::move(artifact).value(), media.title);
        if (!delivered)
        {
            fail(session, delivered.failure());
            return;
        }
        finish(session);
    }

} // namespace clipferry::engine
