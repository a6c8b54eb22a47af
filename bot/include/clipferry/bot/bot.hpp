#pragma once

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <atomic>
#include <thread>
#include <vector>

#include "clipferry/bot/config.hpp"
#include "clipferry/bot/curl_stream_fetcher.hpp"
#include "clipferry/bot/dispatcher.hpp"
#include "clipferry/bot/ffmpeg_transcoder.hpp"
#include "clipferry/bot/http_client.hpp"
#include "clipferry/bot/telegram_client.hpp"
#include "clipferry/bot/telegram_transport.hpp"
#include "clipferry/bot/ytdlp_media_source.hpp"
#include "clipferry/engine/conversation_engine.hpp"
#include "clipferry/engine/download_orchestrator.hpp"
#include "clipferry/engine/scratch_space.hpp"
#include "clipferry/engine/stream_catalog.hpp"

namespace clipferry::bot
{

    class Bot
    {
    public:
        // Throws when the scratch directory is unusable.
        explicit Bot(BotConfig config);

        void run();

    private:
        void poll_loop();
        void handle_signal();

        BotConfig config_;
        asio::io_context io_context_;
        asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
        asio::signal_set signals_;

        HttpClient http_;
        TelegramClient telegram_;
        TelegramInbox inbox_;
        TelegramOutbox outbox_;
        YtDlpMediaSource media_source_;
        CurlStreamFetcher fetcher_;
        FfmpegTranscoder transcoder_;

        engine::ScratchSpace scratch_;
        engine::StreamCatalog catalog_;
        engine::DownloadOrchestrator orchestrator_;
        engine::ConversationEngine engine_;
        Dispatcher dispatcher_;

        std::atomic<bool> stopping_{false};
        std::vector<std::thread> workers_;
    };

} // namespace clipferry::bot
