#pragma once

#include <string>
#include <vector>

#include "clipferry/engine/transcoder.hpp"

namespace clipferry::bot
{

    class FfmpegTranscoder : public engine::Transcoder
    {
    public:
        explicit FfmpegTranscoder(std::string program);

        Status to_mp3(const std::filesystem::path &input, const std::filesystem::path &output, unsigned bitrate_kbps,
                      std::chrono::seconds timeout) override;

        static std::vector<std::string> mp3_arguments(const std::filesystem::path &input,
                                                      const std::filesystem::path &output, unsigned bitrate_kbps);

    private:
        std::string program_;
    };

} // namespace clipferry::bot
