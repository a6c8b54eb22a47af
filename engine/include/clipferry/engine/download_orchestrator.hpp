#pragma once

#include <string>

#include "clipferry/engine/cleanup.hpp"
#include "clipferry/engine/config.hpp"
#include "clipferry/engine/media.hpp"
#include "clipferry/engine/scratch_space.hpp"
#include "clipferry/engine/stream_fetcher.hpp"
#include "clipferry/engine/transcoder.hpp"
#include "clipferry/engine/transport.hpp"
#include "clipferry/error_codes.hpp"

namespace clipferry::engine
{

    struct OrchestratorServices
    {
        ScratchSpace &scratch;
        StreamFetcher &fetcher;
        Transcoder &transcoder;
        Outbox &outbox;
    };

    // Fetches chosen encodings into a session's scratch area, transcodes audio and hands the
    // result to delivery. Only the returned artifact outlives a fetch call.
    class DownloadOrchestrator
    {
    public:
        DownloadOrchestrator(OrchestratorServices services, EngineConfig config);

        // Fails with DownloadError.
        Result<DownloadArtifact> fetch_video(const SessionArea &area, const MediaRef &media,
                                             const StreamDescriptor &descriptor);

        // Fails with DownloadError, SizeLimitExceeded (downloaded size over the limit) or TranscodeError.
        Result<DownloadArtifact> fetch_audio_and_transcode(const SessionArea &area, const MediaRef &media,
                                                           const StreamDescriptor &descriptor);

        // Consumes the artifact; its file is gone when this returns. Fails with DeliveryError.
        Status deliver(const std::string &session_id, DownloadArtifact artifact, const std::string &caption);

        const EngineConfig &config() const noexcept { return config_; }

    private:
        Status fetch_into(const StreamDescriptor &descriptor, const std::filesystem::path &destination);

        OrchestratorServices services_;
        EngineConfig config_;
    };

} // namespace clipferry::engine
