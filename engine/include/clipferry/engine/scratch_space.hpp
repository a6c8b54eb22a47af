#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "clipferry/error_codes.hpp"

namespace clipferry::engine
{

    struct SessionArea
    {
        std::string identity;
        std::filesystem::path root;
    };

    class ScratchError : public std::runtime_error
    {
    public:
        ScratchError(clipferry::ErrorCode code, std::string message);

        clipferry::ErrorCode code() const noexcept { return code_; }

    private:
        clipferry::ErrorCode code_;
    };

    // Scratch storage partitioned into one directory per session.
    class ScratchSpace
    {
    public:
        // Throws ScratchError when the root cannot be created or written.
        explicit ScratchSpace(std::filesystem::path root);

        std::filesystem::path root() const;

        SessionArea session_area(const std::string &identity) const;

        SessionArea prepare_session_area(const std::string &identity) const;

        // Fresh path inside the area; the file itself is not created.
        std::filesystem::path allocate(const SessionArea &area, std::string_view stem,
                                       std::string_view extension) const;

        std::vector<std::filesystem::path> artifacts(const SessionArea &area) const;

        // Deletes everything in the area. Returns the number of entries removed.
        std::size_t purge(const SessionArea &area) const noexcept;

        // Deletes every session area, left over from a previous run.
        std::size_t sweep() const noexcept;

    private:
        std::filesystem::path base_;
        std::filesystem::path sessions_dir_;

        void check_writable() const;
        static std::string sanitize_component(std::string_view value);
    };

} // namespace clipferry::engine
