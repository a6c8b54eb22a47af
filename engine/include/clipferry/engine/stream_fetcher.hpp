#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "clipferry/error_codes.hpp"

namespace clipferry::engine
{

    class StreamFetcher
    {
    public:
        virtual ~StreamFetcher() = default;

        // Writes the stream behind source_handle to destination. Fails with DownloadError.
        virtual Status fetch(const std::string &source_handle, const std::filesystem::path &destination,
                             std::chrono::seconds timeout) = 0;
    };

} // namespace clipferry::engine
