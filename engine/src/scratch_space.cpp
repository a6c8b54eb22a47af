#include "clipferry/engine/scratch_space.hpp"

#include <cctype>
#include <fstream>

#include <spdlog/spdlog.h>

#include "clipferry/crypto.hpp"

namespace clipferry::engine
{

    ScratchError::ScratchError(clipferry::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        constexpr auto kSessionsDir = "sessions";
        constexpr auto kWriteCheckFile = ".write-check";
    } // namespace

    ScratchSpace::ScratchSpace(std::filesystem::path root)
        : base_(std::move(root)), sessions_dir_(base_ / kSessionsDir)
    {
        std::error_code ec;
        std::filesystem::create_directories(sessions_dir_, ec);
        if (ec)
        {
            throw ScratchError(ErrorCode::InternalError,
                               "Cannot create scratch directory " + sessions_dir_.string() + ": " + ec.message());
        }
        check_writable();
    }

    std::filesystem::path ScratchSpace::root() const
    {
        return base_;
    }

    SessionArea ScratchSpace::session_area(const std::string &identity) const
    {
        return SessionArea{
            .identity = identity,
            .root = sessions_dir_ / crypto::identity_token(identity),
        };
    }

    SessionArea ScratchSpace::prepare_session_area(const std::string &identity) const
    {
        auto area = session_area(identity);
        std::error_code ec;
        std::filesystem::create_directories(area.root, ec);
        if (ec)
        {
            throw ScratchError(ErrorCode::DownloadError, "Cannot create session scratch area: " + ec.message());
        }
        return area;
    }

    std::filesystem::path ScratchSpace::allocate(const SessionArea &area, std::string_view stem,
                                                 std::string_view extension) const
    {
        auto name = sanitize_component(stem) + "-" + crypto::random_token();
        const auto suffix = sanitize_component(extension);
        if (!suffix.empty())
        {
            name += "." + suffix;
        }
        return area.root / name;
    }

    std::vector<std::filesystem::path> ScratchSpace::artifacts(const SessionArea &area) const
    {
        std::vector<std::filesystem::path> entries;
        std::error_code ec;
        if (!std::filesystem::is_directory(area.root, ec))
        {
            return entries;
        }
        for (const auto &entry : std::filesystem::directory_iterator(area.root, ec))
        {
            entries.push_back(entry.path());
        }
        return entries;
    }

    std::size_t ScratchSpace::purge(const SessionArea &area) const noexcept
    {
        std::size_t removed = 0;
        try
        {
            for (const auto &path : artifacts(area))
            {
                std::error_code ec;
                const auto count = std::filesystem::remove_all(path, ec);
                if (ec)
                {
                    spdlog::warn("Failed to remove scratch artifact {}: {}", path.string(), ec.message());
                    continue;
                }
                removed += static_cast<std::size_t>(count);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Failed to purge scratch area {}: {}", area.root.string(), ex.what());
        }
        return removed;
    }

    std::size_t ScratchSpace::sweep() const noexcept
    {
        std::size_t removed = 0;
        try
        {
            for (const auto &entry : std::filesystem::directory_iterator(sessions_dir_))
            {
                std::error_code ec;
                const auto count = std::filesystem::remove_all(entry.path(), ec);
                if (ec)
                {
                    spdlog::warn("Failed to remove stale scratch entry {}: {}", entry.path().string(), ec.message());
                    continue;
                }
                removed += static_cast<std::size_t>(count);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Failed to sweep scratch directory {}: {}", sessions_dir_.string(), ex.what());
        }
        return removed;
    }

    void ScratchSpace::check_writable() const
    {
        const auto marker = base_ / kWriteCheckFile;
        {
            std::ofstream out(marker, std::ios::trunc);
            if (!out.is_open())
            {
                throw ScratchError(ErrorCode::InternalError, "Scratch directory is not writable: " + base_.string());
            }
        }
        std::error_code ec;
        std::filesystem::remove(marker, ec);
    }

    std::string ScratchSpace::sanitize_component(std::string_view value)
    {
        std::string sanitized;
        sanitized.reserve(value.size());
        for (const char ch : value)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) || ch == '-' || ch == '_')
            {
                sanitized.push_back(ch);
            }
        }
        return sanitized;
    }

} // namespace clipferry::engine
