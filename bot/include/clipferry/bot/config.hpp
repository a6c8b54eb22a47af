#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "clipferry/engine/config.hpp"

namespace clipferry::bot
{

    struct BotConfig
    {
        std::string telegram_token;
        std::string api_base_url{"https://api.telegram.org"};
        std::string ytdlp_program{"yt-dlp"};
        std::string ffmpeg_program{"ffmpeg"};
        std::size_t worker_threads{0};
        std::chrono::seconds poll_timeout{std::chrono::seconds{30}};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
        engine::EngineConfig engine;
    };

    class UsageError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Defaults, then --config <file.json>, then TELEGRAM_TOKEN, then flags. Throws UsageError.
    BotConfig parse_arguments(const std::vector<std::string> &args, const std::optional<std::string> &env_token);

    void apply_config_file(BotConfig &config, const std::filesystem::path &path);

    void validate(const BotConfig &config);

    std::string usage(const std::string &program_name);

} // namespace clipferry::bot
