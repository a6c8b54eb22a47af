#include "clipferry/engine/cleanup.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace clipferry::engine
{

    bool discard_artifact(const std::filesystem::path &path) noexcept
    {
        if (path.empty())
        {
            return true;
        }
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
        {
            spdlog::warn("Failed to delete scratch artifact {}: {}", path.string(), ec.message());
            return false;
        }
        spdlog::debug("Deleted scratch artifact {}", path.string());
        return true;
    }

    CleanupScope::CleanupScope(std::string owner) : owner_(std::move(owner)) {}

    CleanupScope::~CleanupScope()
    {
        for (const auto &path : paths_)
        {
            discard_artifact(path);
        }
        if (!paths_.empty())
        {
            spdlog::debug("Cleanup for {} removed {} intermediate artifact(s)", owner_, paths_.size());
        }
    }

    std::filesystem::path CleanupScope::track(std::filesystem::path path)
    {
        spdlog::debug("Scratch artifact {} registered for {}", path.string(), owner_);
        paths_.push_back(std::move(path));
        return paths_.back();
    }

    std::filesystem::path CleanupScope::release(const std::filesystem::path &path)
    {
        const auto it = std::find(paths_.begin(), paths_.end(), path);
        if (it == paths_.end())
        {
            return path;
        }
        auto released = std::move(*it);
        paths_.erase(it);
        return released;
    }

    void CleanupScope::discard(const std::filesystem::path &path) noexcept
    {
        const auto it = std::find(paths_.begin(), paths_.end(), path);
        if (it == paths_.end())
        {
            return;
        }
        discard_artifact(*it);
        paths_.erase(it);
    }

    DownloadArtifact::DownloadArtifact(std::filesystem::path path, DeliveryKind kind, std::uint64_t size_bytes)
        : path_(std::move(path)), kind_(kind), size_bytes_(size_bytes) {}

    DownloadArtifact::~DownloadArtifact()
    {
        discard_artifact(path_);
    }

    DownloadArtifact::DownloadArtifact(DownloadArtifact &&other) noexcept
        : path_(std::move(other.path_)), kind_(other.kind_), size_bytes_(other.size_bytes_)
    {
        other.path_.clear();
    }

    DownloadArtifact &DownloadArtifact::operator=(DownloadArtifact &&other) noexcept
    {
        if (this != &other)
        {
            discard_artifact(path_);
            path_ = std::move(other.path_);
            kind_ = other.kind_;
            size_bytes_ = other.size_bytes_;
            other.path_.clear();
        }
        return *this;
    }

} // namespace clipferry::engine
