#include "clipferry/bot/config.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>
#include <string_view>

#include <nlohmann/json.hpp>

namespace clipferry::bot
{

    namespace
    {

        constexpr std::size_t kMaxWorkerThreads = 256;

        constexpr std::string_view kLogLevels[] = {"trace", "debug", "info", "warning", "warn", "error", "critical", "off"};

        const std::string &require_value(const std::vector<std::string> &args, std::size_t &index)
        {
            if (index + 1 >= args.size())
            {
                throw UsageError("Missing value for " + args[index]);
            }
            ++index;
            return args[index];
        }

        std::uint64_t parse_unsigned(const std::string &flag, const std::string &value)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size() || value.front() == '-')
                {
                    throw UsageError("Invalid value for " + flag + ": " + value);
                }
                return parsed;
            }
            catch (const std::logic_error &)
            {
                throw UsageError("Invalid value for " + flag + ": " + value);
            }
        }

        template <typename T>
        T unsigned_value(const nlohmann::json &json, const char *key, T fallback, const std::filesystem::path &path)
        {
            const auto it = json.find(key);
            if (it == json.end())
            {
                return fallback;
            }
            if (!it->is_number_unsigned() || it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
            {
                throw UsageError("Invalid value for " + std::string(key) + " in config file " + path.string());
            }
            return static_cast<T>(it->get<std::uint64_t>());
        }

        std::optional<std::filesystem::path> find_config_file(const std::vector<std::string> &args)
        {
            for (std::size_t i = 1; i < args.size(); ++i)
            {
                if (args[i] == "--config")
                {
                    return std::filesystem::path(require_value(args, i));
                }
            }
            return std::nullopt;
        }

    } // namespace

    void apply_config_file(BotConfig &config, const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw UsageError("Cannot open config file " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw UsageError("Malformed config file " + path.string() + ": " + ex.what());
        }
        if (!json.is_object())
        {
            throw UsageError("Config file " + path.string() + " must contain a JSON object");
        }

        try
        {
            config.telegram_token = json.value("token", config.telegram_token);
            config.api_base_url = json.value("api_url", config.api_base_url);
            config.ytdlp_program = json.value("ytdlp", config.ytdlp_program);
            config.ffmpeg_program = json.value("ffmpeg", config.ffmpeg_program);
            config.worker_threads = unsigned_value(json, "threads", config.worker_threads, path);
            config.poll_timeout =
                std::chrono::seconds(unsigned_value(json, "poll_timeout_seconds", config.poll_timeout.count(), path));
            config.log_level = json.value("log_level", config.log_level);
            if (json.contains("log_file"))
            {
                config.log_file = std::filesystem::path(json.at("log_file").get<std::string>());
            }

            auto &engine = config.engine;
            engine.size_limit_bytes = unsigned_value(json, "size_limit_bytes", engine.size_limit_bytes, path);
            engine.scratch_root = json.value("scratch_root", engine.scratch_root.string());
            engine.operation_timeout = std::chrono::seconds(
                unsigned_value(json, "operation_timeout_seconds", engine.operation_timeout.count(), path));
            engine.audio_bitrate_kbps = unsigned_value(json, "audio_bitrate_kbps", engine.audio_bitrate_kbps, path);
            engine.progressive_container = json.value("progressive_container", engine.progressive_container);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw UsageError("Invalid value in config file " + path.string() + ": " + ex.what());
        }
    }

    BotConfig parse_arguments(const std::vector<std::string> &args, const std::optional<std::string> &env_token)
    {
        BotConfig config;
        if (const auto file = find_config_file(args))
        {
            apply_config_file(config, *file);
        }
        if (env_token && !env_token->empty())
        {
            config.telegram_token = *env_token;
        }

        for (std::size_t i = 1; i < args.size(); ++i)
        {
            const auto &arg = args[i];
            if (arg == "--config")
            {
                ++i;
            }
            else if (arg == "--token")
            {
                config.telegram_token = require_value(args, i);
            }
            else if (arg == "--scratch")
            {
                config.engine.scratch_root = std::filesystem::path(require_value(args, i));
            }
            else if (arg == "--size-limit")
            {
                config.engine.size_limit_bytes = parse_unsigned(arg, require_value(args, i));
            }
            else if (arg == "--timeout")
            {
                config.engine.operation_timeout =
                    std::chrono::seconds(static_cast<long long>(parse_unsigned(arg, require_value(args, i))));
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(parse_unsigned(arg, require_value(args, i)));
            }
            else if (arg == "--poll-timeout")
            {
                config.poll_timeout =
                    std::chrono::seconds(static_cast<long long>(parse_unsigned(arg, require_value(args, i))));
            }
            else if (arg == "--ytdlp")
            {
                config.ytdlp_program = require_value(args, i);
            }
            else if (arg == "--ffmpeg")
            {
                config.ffmpeg_program = require_value(args, i);
            }
            else if (arg == "--api-url")
            {
                config.api_base_url = require_value(args, i);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_value(args, i));
            }
            else if (arg == "--log-level")
            {
                config.log_level = require_value(args, i);
            }
            else
            {
                throw UsageError("Unknown argument: " + arg);
            }
        }

        validate(config);
        return config;
    }

    void validate(const BotConfig &config)
    {
        if (config.telegram_token.empty())
        {
            throw UsageError("TELEGRAM_TOKEN not set (use --token or the environment variable)");
        }
        if (config.engine.size_limit_bytes == 0)
        {
            throw UsageError("Size limit must be greater than zero");
        }
        if (config.engine.operation_timeout.count() <= 0)
        {
            throw UsageError("Operation timeout must be greater than zero");
        }
        if (config.worker_threads > kMaxWorkerThreads)
        {
            throw UsageError("Worker thread count must not exceed " + std::to_string(kMaxWorkerThreads));
        }
        if (config.engine.audio_bitrate_kbps == 0)
        {
            throw UsageError("Audio bitrate must be greater than zero");
        }
        if (config.poll_timeout.count() <= 0)
        {
            throw UsageError("Poll timeout must be greater than zero");
        }
        if (config.engine.scratch_root.empty())
        {
            throw UsageError("Scratch directory must not be empty");
        }
        if (std::find(std::begin(kLogLevels), std::end(kLogLevels), config.log_level) == std::end(kLogLevels))
        {
            throw UsageError("Unknown log level: " + config.log_level);
        }
    }

    std::string usage(const std::string &program_name)
    {
        return "Usage: " + program_name +
               " [--config <FILE>] [--token <TOKEN>] [--scratch <DIR>] [--size-limit <bytes>] [--timeout <seconds>]"
               " [--threads <N>] [--poll-timeout <seconds>] [--ytdlp <PATH>] [--ffmpeg <PATH>] [--api-url <URL>]"
               " [--log <FILE>] [--log-level <LEVEL>]\n"
               "The bot token may also be provided through the TELEGRAM_TOKEN environment variable.\n";
    }

} // namespace clipferry::bot
