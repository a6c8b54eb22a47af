#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "clipferry/bot/bot.hpp"
#include "clipferry/bot/config.hpp"
#include "clipferry/bot/http_client.hpp"
#include "clipferry/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void configure_logging(const clipferry::bot::BotConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("clipferry", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    using clipferry::bot::Bot;
    using clipferry::bot::BotConfig;

    std::vector<std::string> args(argv, argv + argc);
    const std::string program = args.empty() ? std::string("clipferry_bot") : args.front();

    for (std::size_t i = 1; i < args.size(); ++i)
    {
        if (args[i] == "--help" || args[i] == "-h")
        {
            std::cout << clipferry::bot::usage(program);
            return EXIT_SUCCESS;
        }
    }

    std::optional<std::string> env_token;
    if (const char *token = std::getenv("TELEGRAM_TOKEN"); token != nullptr && *token != '\0')
    {
        env_token = std::string(token);
    }

    BotConfig config;
    try
    {
        config = clipferry::bot::parse_arguments(args, env_token);
    }
    catch (const clipferry::bot::UsageError &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << clipferry::bot::usage(program);
        return EXIT_FAILURE;
    }

    try
    {
        configure_logging(config);
        spdlog::info("Starting ClipFerry bot {}", clipferry::version());

        clipferry::bot::CurlGlobal curl;
        Bot bot(std::move(config));
        bot.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Bot failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    spdlog::info("ClipFerry bot stopped");
    return EXIT_SUCCESS;
}
