#include "clipferry/engine/download_orchestrator.hpp"

#include <spdlog/spdlog.h>

#include "clipferry/engine/size_gate.hpp"

namespace clipferry::engine
{

    namespace
    {

        std::string container_or(const StreamDescriptor &descriptor, std::string_view fallback)
        {
            return descriptor.container.empty() ? std::string(fallback) : descriptor.container;
        }

    } // namespace

    DownloadOrchestrator::DownloadOrchestrator(OrchestratorServices services, EngineConfig config)
        : services_(services), config_(std::move(config)) {}

    Result<DownloadArtifact> DownloadOrchestrator::fetch_video(const SessionArea &area, const MediaRef &media,
                                                              const StreamDescriptor &descriptor)
    {
        CleanupScope scope(area.identity);
        try
        {
            const auto target = scope.track(services_.scratch.allocate(area, "video", container_or(descriptor, "mp4")));
            spdlog::info("Fetching {} video of \"{}\" for {}", descriptor.resolution_tag, media.title, area.identity);

            auto fetched = fetch_into(descriptor, target);
            if (!fetched)
            {
                return fetched.failure();
            }

            std::error_code ec;
            const auto size = std::filesystem::file_size(target, ec);
            if (ec)
            {
                return make_failure(ErrorCode::DownloadError, "Downloaded file is missing: " + ec.message());
            }
            return DownloadArtifact(scope.release(target), DeliveryKind::Video, size);
        }
        catch (const std::exception &ex)
        {
            return make_failure(ErrorCode::DownloadError, ex.what());
        }
    }

    Result<DownloadArtifact> DownloadOrchestrator::fetch_audio_and_transcode(const SessionArea &area,
                                                                            const MediaRef &media,
                                                                            const StreamDescriptor &descriptor)
    {
        CleanupScope scope(area.identity);
        try
        {
            const auto raw_path = scope.track(services_.scratch.allocate(area, "audio", container_or(descriptor, "m4a")));
            spdlog::info("Fetching audio of \"{}\" for {}", media.title, area.identity);

            auto fetched = fetch_into(descriptor, raw_path);
            if (!fetched)
            {
                return fetched.failure();
            }

            std::error_code ec;
            const auto downloaded = std::filesystem::file_size(raw_path, ec);
            if (ec)
            {
                return make_failure(ErrorCode::DownloadError, "Downloaded file is missing: " + ec.message());
            }
            if (downloaded != descriptor.size_bytes)
            {
                spdlog::debug("Declared audio size {} differs from downloaded {}, re-checking limit",
                              descriptor.size_bytes, downloaded);
                if (!admit(downloaded, config_.size_limit_bytes).admitted)
                {
                    scope.discard(raw_path);
                    return make_failure(ErrorCode::SizeLimitExceeded,
                                        describe_rejection(downloaded, config_.size_limit_bytes));
                }
            }

            const auto mp3_path = scope.track(services_.scratch.allocate(area, "audio", "mp3"));
            auto transcoded = services_.transcoder.to_mp3(raw_path, mp3_path, config_.audio_bitrate_kbps,
                                                          config_.operation_timeout);
            if (!transcoded)
            {
                scope.discard(raw_path);
                return make_failure(ErrorCode::TranscodeError, transcoded.failure().message);
            }

            const auto size = std::filesystem::file_size(mp3_path, ec);
            if (ec)
            {
                return make_failure(ErrorCode::TranscodeError, "Transcoder produced no output: " + ec.message());
            }
            return DownloadArtifact(scope.release(mp3_path), DeliveryKind::Audio, size);
        }
        catch (const std::exception &ex)
        {
            return make_failure(ErrorCode::DownloadError, ex.what());
        }
    }

    Status DownloadOrchestrator::deliver(const std::string &session_id, DownloadArtifact artifact,
                                         const std::string &caption)
    {
        // Local owner so the file is deleted before this returns, not when the caller drops the argument.
        const DownloadArtifact owned = std::move(artifact);
        spdlog::info("Delivering {} ({}) to {}", to_string(owned.kind()), format_megabytes(owned.size_bytes()),
                     session_id);
        try
        {
            auto delivered = services_.outbox.deliver_file(session_id, owned.path(), owned.kind(), caption,
                                                           config_.operation_timeout);
            if (!delivered)
            {
                return make_failure(ErrorCode::DeliveryError, delivered.failure().message);
            }
            return ok_status();
        }
        catch (const std::exception &ex)
        {
            return make_failure(ErrorCode::DeliveryError, ex.what());
        }
    }

    Status DownloadOrchestrator::fetch_into(const StreamDescriptor &descriptor, const std::filesystem::path &destination)
    {
        auto fetched = services_.fetcher.fetch(descriptor.source_handle, destination, config_.operation_timeout);
        if (!fetched)
        {
            spdlog::warn("Fetch of {} failed: {}", destination.filename().string(), fetched.failure().message);
            return make_failure(ErrorCode::DownloadError, fetched.failure().message);
        }
        return ok_status();
    }

} // namespace clipferry::engine
