#include "clipferry/bot/bot.hpp"

#include <csignal>

#include <spdlog/spdlog.h>

#include "clipferry/version.hpp"

namespace clipferry::bot
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        std::string user_agent()
        {
            return "clipferry/" + std::string(clipferry::version());
        }

    } // namespace

    Bot::Bot(BotConfig config)
        : config_(std::move(config)),
          work_guard_(asio::make_work_guard(io_context_)),
          signals_(io_context_),
          http_(user_agent()),
          telegram_(http_, config_.api_base_url, config_.telegram_token),
          inbox_(telegram_),
          outbox_(telegram_, config_.engine.operation_timeout),
          media_source_(config_.ytdlp_program, config_.engine.operation_timeout),
          fetcher_(http_),
          transcoder_(config_.ffmpeg_program),
          scratch_(config_.engine.scratch_root),
          catalog_(media_source_, config_.engine.progressive_container),
          orchestrator_(engine::OrchestratorServices{scratch_, fetcher_, transcoder_, outbox_}, config_.engine),
          engine_(engine::EngineServices{catalog_, orchestrator_, scratch_, outbox_}, config_.engine),
          dispatcher_(io_context_, engine_)
    {
        const auto stale = scratch_.sweep();
        if (stale > 0)
        {
            spdlog::info("Removed {} stale scratch entries from {}", stale, scratch_.root().string());
        }

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Bot::run()
    {
        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Bot running with {} worker threads, size limit {} bytes, scratch {}", worker_count,
                     config_.engine.size_limit_bytes, scratch_.root().string());

        poll_loop();

        std::error_code ec;
        signals_.cancel(ec);
        work_guard_.reset();
        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        spdlog::info("All pending intents finished");
    }

    void Bot::poll_loop()
    {
        while (!stopping_.load())
        {
            for (const auto &message : inbox_.poll(config_.poll_timeout))
            {
                dispatcher_.dispatch(message);
            }
        }
    }

    void Bot::handle_signal()
    {
        stopping_.store(true);
        spdlog::info("Signal received, shutting down after the current poll");
    }

} // namespace clipferry::bot
