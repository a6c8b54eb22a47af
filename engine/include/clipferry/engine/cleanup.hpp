#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "clipferry/engine/media.hpp"

namespace clipferry::engine
{

    // Removes a scratch file. Failures are logged and swallowed so they never mask the caller's outcome.
    bool discard_artifact(const std::filesystem::path &path) noexcept;

    // Tracks temporary paths created during one operation. Every tracked path that was not
    // released is deleted when the scope ends, whichever way the operation exits.
    class CleanupScope
    {
    public:
        explicit CleanupScope(std::string owner);
        ~CleanupScope();

        CleanupScope(const CleanupScope &) = delete;
        CleanupScope &operator=(const CleanupScope &) = delete;

        std::filesystem::path track(std::filesystem::path path);

        // Stops tracking path and hands it to the caller.
        std::filesystem::path release(const std::filesystem::path &path);

        // Deletes a tracked path now instead of at scope exit.
        void discard(const std::filesystem::path &path) noexcept;

        std::size_t pending() const noexcept { return paths_.size(); }

    private:
        std::string owner_;
        std::vector<std::filesystem::path> paths_;
    };

    // The deliverable produced by a fetch. Owns its file, which is deleted when the artifact is destroyed.
    class DownloadArtifact
    {
    public:
        DownloadArtifact(std::filesystem::path path, DeliveryKind kind, std::uint64_t size_bytes);
        ~DownloadArtifact();

        DownloadArtifact(DownloadArtifact &&other) noexcept;
        DownloadArtifact &operator=(DownloadArtifact &&other) noexcept;
        DownloadArtifact(const DownloadArtifact &) = delete;
        DownloadArtifact &operator=(const DownloadArtifact &) = delete;

        const std::filesystem::path &path() const noexcept { return path_; }
        DeliveryKind kind() const noexcept { return kind_; }
        std::uint64_t size_bytes() const noexcept { return size_bytes_; }

    private:
        std::filesystem::path path_;
        DeliveryKind kind_;
        std::uint64_t size_bytes_;
    };

} // namespace clipferry::engine
