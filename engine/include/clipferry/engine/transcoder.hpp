#pragma once

#include <chrono>
#include <filesystem>

#include "clipferry/error_codes.hpp"

namespace clipferry::engine
{

    class Transcoder
    {
    public:
        virtual ~Transcoder() = default;

        // Constant bitrate MP3 conversion. Fails with TranscodeError.
        virtual Status to_mp3(const std::filesystem::path &input, const std::filesystem::path &output,
                              unsigned bitrate_kbps, std::chrono::seconds timeout) = 0;
    };

} // namespace clipferry::engine
