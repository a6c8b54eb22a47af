#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "clipferry/engine/media_source.hpp"

namespace clipferry::bot
{

    bool looks_like_url(std::string_view reference) noexcept;

    // Maps one entry of yt-dlp's "formats" array.
    engine::StreamDescriptor descriptor_from_format(const nlohmann::json &format);

    // Maps the document printed by "yt-dlp -J", preferred formats first. Throws
    // nlohmann::json::exception on malformed input.
    engine::MediaRef media_from_info(const std::string &reference, const nlohmann::json &info);

    // Resolves references with the yt-dlp command line tool.
    class YtDlpMediaSource : public engine::MediaSource
    {
    public:
        YtDlpMediaSource(std::string program, std::chrono::seconds timeout);

        Result<engine::MediaRef> resolve(const std::string &reference) override;

        Result<std::vector<engine::StreamDescriptor>> enumerate(const engine::MediaRef &media) override;

    private:
        std::string program_;
        std::chrono::seconds timeout_;
    };

} // namespace clipferry::bot
