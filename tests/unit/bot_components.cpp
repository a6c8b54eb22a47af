#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "clipferry/bot/config.hpp"
#include "clipferry/bot/dispatcher.hpp"
#include "clipferry/bot/ffmpeg_transcoder.hpp"
#include "clipferry/bot/http_client.hpp"
#include "clipferry/bot/process.hpp"
#include "clipferry/bot/telegram_client.hpp"
#include "clipferry/bot/telegram_protocol.hpp"
#include "clipferry/bot/telegram_transport.hpp"
#include "clipferry/bot/ytdlp_media_source.hpp"
#include "clipferry/engine/stream_catalog.hpp"

#include "test_doubles.hpp"

using namespace clipferry;
using namespace clipferry::bot;
using namespace clipferry::testing;
using namespace std::chrono_literals;

namespace
{

    void test_config_defaults_and_flags()
    {
        const auto config = parse_arguments({"clipferry_bot"}, std::string("env-token"));
        assert(config.telegram_token == "env-token");
        assert(config.engine.size_limit_bytes == 52428800ULL);
        assert(config.engine.scratch_root == std::filesystem::path("downloads"));
        assert(config.engine.operation_timeout == 120s);
        assert(config.engine.audio_bitrate_kbps == 192);
        assert(config.poll_timeout == 30s);
        assert(!config.log_file);

        const auto flagged = parse_arguments({"clipferry_bot", "--token", "flag-token", "--size-limit", "1024",
                                              "--scratch", "/tmp/cf", "--timeout", "5", "--threads", "3",
                                              "--log-level", "debug", "--log", "bot.log"},
                                             std::string("env-token"));
        assert(flagged.telegram_token == "flag-token");
        assert(flagged.engine.size_limit_bytes == 1024);
        assert(flagged.engine.scratch_root == std::filesystem::path("/tmp/cf"));
        assert(flagged.engine.operation_timeout == 5s);
        assert(flagged.worker_threads == 3);
        assert(flagged.log_level == "debug");
        assert(flagged.log_file == std::filesystem::path("bot.log"));
    }

    void expect_usage_error(const std::vector<std::string> &args, const std::optional<std::string> &token)
    {
        bool thrown = false;
        try
        {
            (void)parse_arguments(args, token);
        }
        catch (const UsageError &)
        {
            thrown = true;
        }
        assert(thrown);
    }

    void test_config_rejections()
    {
        expect_usage_error({"clipferry_bot"}, std::nullopt);
        expect_usage_error({"clipferry_bot", "--token"}, std::nullopt);
        expect_usage_error({"clipferry_bot", "--frobnicate"}, std::string("t"));
        expect_usage_error({"clipferry_bot", "--size-limit", "0"}, std::string("t"));
        expect_usage_error({"clipferry_bot", "--size-limit", "-5"}, std::string("t"));
        expect_usage_error({"clipferry_bot", "--timeout", "ten"}, std::string("t"));
        expect_usage_error({"clipferry_bot", "--log-level", "chatty"}, std::string("t"));
        expect_usage_error({"clipferry_bot", "--config", "/nonexistent/clipferry.json"}, std::string("t"));
        expect_usage_error({"clipferry_bot", "--poll-timeout", "0"}, std::string("t"));
        expect_usage_error({"clipferry_bot", "--threads", "100000"}, std::string("t"));
        assert(usage("clipferry_bot").find("--size-limit") != std::string::npos);

        // Config file values get the same checks as flags; negative numbers must not wrap around.
        const auto dir = fresh_directory("config_rejections");
        const auto file = dir / "bad.json";
        const std::vector<std::string> bad_documents = {
            R"({"size_limit_bytes": -1})",
            R"({"size_limit_bytes": 1.5})",
            R"({"size_limit_bytes": "50MB"})",
            R"({"threads": -1})",
            R"({"audio_bitrate_kbps": 0})",
            R"({"audio_bitrate_kbps": -192})",
            R"({"poll_timeout_seconds": -5})",
            R"({"poll_timeout_seconds": 0})",
            R"({"operation_timeout_seconds": -1})",
        };
        for (const auto &document : bad_documents)
        {
            {
                std::ofstream out(file, std::ios::trunc);
                out << document;
            }
            expect_usage_error({"clipferry_bot", "--config", file.string()}, std::string("t"));
        }
        remove_directory(dir);
    }

    void test_config_file_layering()
    {
        const auto dir = fresh_directory("config");
        const auto file = dir / "bot.json";
        {
            std::ofstream out(file);
            out << R"({"token": "file-token", "size_limit_bytes": 2048, "scratch_root": "/var/tmp/clipferry",
                       "threads": 6, "audio_bitrate_kbps": 128, "ytdlp": "/opt/yt-dlp"})";
        }

        const auto from_file = parse_arguments({"clipferry_bot", "--config", file.string()}, std::nullopt);
        assert(from_file.telegram_token == "file-token");
        assert(from_file.engine.size_limit_bytes == 2048);
        assert(from_file.engine.scratch_root == std::filesystem::path("/var/tmp/clipferry"));
        assert(from_file.engine.audio_bitrate_kbps == 128);
        assert(from_file.worker_threads == 6);
        assert(from_file.ytdlp_program == "/opt/yt-dlp");

        const auto layered = parse_arguments({"clipferry_bot", "--threads", "2", "--config", file.string()},
                                             std::string("env-token"));
        assert(layered.telegram_token == "env-token");
        assert(layered.worker_threads == 2);
        assert(layered.engine.size_limit_bytes == 2048);

        {
            std::ofstream out(file, std::ios::trunc);
            out << "{ not json";
        }
        expect_usage_error({"clipferry_bot", "--config", file.string()}, std::string("t"));
        remove_directory(dir);
    }

    void test_ytdlp_format_mapping()
    {
        const auto progressive_format = descriptor_from_format(nlohmann::json{
            {"format_id", "18"},
            {"ext", "mp4"},
            {"vcodec", "avc1.42001E"},
            {"acodec", "mp4a.40.2"},
            {"height", 360},
            {"fps", 29.97},
            {"filesize", 12345678},
            {"protocol", "https"},
            {"url", "https://cdn.example/18.mp4"},
        });
        assert(progressive_format.kind == engine::StreamKind::VideoProgressive);
        assert(progressive_format.resolution_tag == "360p");
        assert(progressive_format.fps == 30);
        assert(progressive_format.size_bytes == 12345678);
        assert(progressive_format.container == "mp4");
        assert(progressive_format.source_handle == "https://cdn.example/18.mp4");

        const auto audio_format = descriptor_from_format(nlohmann::json{
            {"ext", "m4a"},
            {"vcodec", "none"},
            {"acodec", "mp4a.40.2"},
            {"filesize", nullptr},
            {"filesize_approx", 3000000},
            {"protocol", "https"},
            {"url", "https://cdn.example/140.m4a"},
        });
        assert(audio_format.kind == engine::StreamKind::AudioOnly);
        assert(audio_format.resolution_tag.empty());
        assert(audio_format.size_bytes == 3000000);

        const auto video_only = descriptor_from_format(nlohmann::json{
            {"ext", "mp4"}, {"vcodec", "avc1"}, {"acodec", "none"}, {"height", 1080}, {"protocol", "https"}});
        assert(video_only.kind == engine::StreamKind::Other);

        const auto segmented = descriptor_from_format(nlohmann::json{
            {"ext", "mp4"}, {"vcodec", "avc1"}, {"acodec", "mp4a"}, {"height", 720}, {"protocol", "m3u8_native"}});
        assert(segmented.kind == engine::StreamKind::Other);

        const auto info = nlohmann::json::parse(R"({"formats": [{"ext": "webm", "vcodec": "none", "acodec": "opus"}]})");
        const auto media = media_from_info("https://video.example/watch?v=1", info);
        assert(media.title == "https://video.example/watch?v=1");
        assert(media.streams.size() == 1);

        assert(looks_like_url("https://video.example/watch?v=1"));
        assert(!looks_like_url("ref-A"));
        assert(!looks_like_url("https://"));
        assert(!looks_like_url("https://video.example/a b"));
    }

    void test_ytdlp_prefers_best_audio()
    {
        const auto info = nlohmann::json::parse(R"({
            "title": "Clip",
            "formats": [
                {"format_id": "139", "ext": "m4a", "vcodec": "none", "acodec": "mp4a.40.5", "abr": 48.8,
                 "filesize": 1000, "protocol": "https", "url": "https://x/139"},
                {"format_id": "18", "ext": "mp4", "vcodec": "avc1", "acodec": "mp4a.40.2", "height": 360,
                 "filesize": 5000, "protocol": "https", "url": "https://x/18"},
                {"format_id": "140", "ext": "m4a", "vcodec": "none", "acodec": "mp4a.40.2", "abr": 129.5,
                 "filesize": 3000, "protocol": "https", "url": "https://x/140"}
            ]
        })");
        const auto media = media_from_info("https://video.example/watch?v=2", info);
        assert(media.streams.size() == 3);
        assert(media.streams.front().source_handle == "https://x/140");

        FakeMediaSource source;
        source.add(media.reference, media.title, media.streams);
        engine::StreamCatalog catalog(source, "mp4");
        const auto resolved = catalog.resolve_media(media.reference);
        const auto audio = catalog.list_audio_only(resolved.value());
        assert(audio.ok());
        assert(audio.value().front().source_handle == "https://x/140");
        assert(audio.value().back().source_handle == "https://x/139");
    }

    void test_ytdlp_failures()
    {
        YtDlpMediaSource not_url("yt-dlp", 5s);
        assert(not_url.resolve("not a link").code() == ErrorCode::InvalidReference);

        YtDlpMediaSource failing("false", 5s);
        assert(failing.resolve("https://video.example/x").code() == ErrorCode::InvalidReference);

        // echo prints its arguments back, which is not a metadata document.
        YtDlpMediaSource garbled("echo", 5s);
        assert(garbled.resolve("https://video.example/x").code() == ErrorCode::MetadataFetchError);

        YtDlpMediaSource missing("clipferry-no-such-tool", 5s);
        assert(missing.resolve("https://video.example/x").code() == ErrorCode::MetadataFetchError);
    }

    void test_ffmpeg_transcoder()
    {
        const auto args = FfmpegTranscoder::mp3_arguments("in.m4a", "out.mp3", 192);
        const std::vector<std::string> expected = {"-y", "-loglevel", "error", "-i", "in.m4a", "-vn", "-codec:a",
                                                   "libmp3lame", "-b:a", "192k", "-f", "mp3", "out.mp3"};
        assert(args == expected);

        const auto dir = fresh_directory("ffmpeg");
        const auto input = dir / "in.m4a";
        write_file(input, 16);

        FfmpegTranscoder failing("false");
        const auto failed = failing.to_mp3(input, dir / "out.mp3", 192, 5s);
        assert(failed.code() == ErrorCode::TranscodeError);
        assert(failed.failure().message == "ffmpeg exited with code 1");

        FfmpegTranscoder silent("true");
        assert(silent.to_mp3(input, dir / "out.mp3", 192, 5s).code() == ErrorCode::TranscodeError);

        FfmpegTranscoder missing("clipferry-no-such-tool");
        assert(missing.to_mp3(input, dir / "out.mp3", 192, 5s).code() == ErrorCode::TranscodeError);
        remove_directory(dir);
    }

    void test_process_runner()
    {
        const auto result = run_process("sh", {"-c", "printf out; printf 'first\\nlast\\n' >&2; exit 3"}, 5000ms);
        assert(!result.timed_out);
        assert(result.exit_code == 3);
        assert(!result.succeeded());
        assert(result.standard_output == "out");
        assert(last_line(result.standard_error) == "last");

        assert(run_process("true", {}, 5000ms).succeeded());

        const auto started = std::chrono::steady_clock::now();
        const auto slow = run_process("sleep", {"10"}, 300ms);
        assert(slow.timed_out);
        assert(std::chrono::steady_clock::now() - started < 5s);

        bool thrown = false;
        try
        {
            (void)run_process("clipferry-no-such-tool", {}, 1000ms);
        }
        catch (const std::system_error &)
        {
            thrown = true;
        }
        assert(thrown);
        assert(last_line("\n\n").empty());
    }

    void test_telegram_updates()
    {
        const auto json = nlohmann::json::parse(R"({
            "ok": true,
            "result": [
                {"update_id": 10, "message": {"message_id": 1, "chat": {"id": 555}, "text": "/start"}},
                {"update_id": 11, "message": {"message_id": 2, "chat": {"id": 555}, "sticker": {}}},
                {"update_id": 12, "edited_message": {"message_id": 1, "chat": {"id": 555}, "text": "x"}},
                {"update_id": 13, "message": {"message_id": 3, "chat": {"id": -777}, "text": "https://v.example/1"}}
            ]
        })");
        const auto response = json.get<telegram::ApiResponse>();
        assert(response.ok);
        const auto updates = response.result.get<std::vector<telegram::Update>>();
        assert(updates.size() == 4);

        std::int64_t offset = 0;
        const auto messages = collect_messages(updates, offset);
        assert(offset == 14);
        assert(messages.size() == 2);
        assert(messages[0].session_id == "555");
        assert(messages[0].text == "/start");
        assert(messages[1].session_id == "-777");

        const auto failure = nlohmann::json::parse(R"({"ok": false, "error_code": 401, "description": "Unauthorized"})")
                                 .get<telegram::ApiResponse>();
        assert(!failure.ok);
        assert(failure.error_code == 401);
        assert(failure.description == "Unauthorized");

        const nlohmann::json request = telegram::GetUpdatesRequest{.offset = 14, .timeout_seconds = 30};
        assert(request.at("offset") == 14);
        assert(request.at("allowed_updates").at(0) == "message");
        const nlohmann::json send = telegram::SendMessageRequest{.chat_id = 555, .text = "hi"};
        assert(send.at("chat_id") == 555);

        assert(telegram::upload_method(engine::DeliveryKind::Audio) == "sendAudio");
        assert(telegram::upload_field(engine::DeliveryKind::Video) == "video");
    }

    void test_telegram_client_urls()
    {
        HttpClient http("clipferry-test");
        TelegramClient client(http, "https://api.telegram.example/", "123:abc");
        assert(client.method_url("getUpdates") == "https://api.telegram.example/bot123:abc/getUpdates");

        TelegramOutbox outbox(client, 1s);
        const auto delivered = outbox.deliver_file("not-a-chat", "/tmp/none.mp4", engine::DeliveryKind::Video, "", 1s);
        assert(delivered.code() == ErrorCode::DeliveryError);
    }

    void test_dispatcher_serializes_sessions()
    {
        EngineHarness harness("dispatcher");
        harness.source.add("ref-A", "Clip A", {progressive("720p", 30, 30 * kMegabyte)});

        asio::io_context io_context;
        Dispatcher dispatcher(io_context, harness.engine);
        for (const auto *session : {"1", "2", "3"})
        {
            dispatcher.dispatch(engine::InboundMessage{session, "ref-A"});
            dispatcher.dispatch(engine::InboundMessage{session, "/video"});
            dispatcher.dispatch(engine::InboundMessage{session, "/res_720p"});
        }
        dispatcher.dispatch(engine::InboundMessage{"4", "/video"});

        std::vector<std::thread> workers;
        for (int i = 0; i < 3; ++i)
        {
            workers.emplace_back([&io_context]
                                 { io_context.run(); });
        }
        for (auto &worker : workers)
        {
            worker.join();
        }

        for (const auto *session : {"1", "2", "3"})
        {
            const auto replies = harness.outbox.replies_for(session);
            assert(replies.size() == 4);
            assert(replies.back() == "Done! Send another URL or /cancel to stop.");
        }
        assert(harness.outbox.replies_for("4").size() == 1);
        assert(harness.outbox.deliveries.size() == 3);
        assert(dispatcher.active_strands() == 0);
        assert(harness.engine.active_sessions() == 0);
    }

} // namespace

void run_bot_component_tests()
{
    test_config_defaults_and_flags();
    test_config_rejections();
    test_config_file_layering();
    test_ytdlp_format_mapping();
    test_ytdlp_prefers_best_audio();
    test_ytdlp_failures();
    test_ffmpeg_transcoder();
    test_process_runner();
    test_telegram_updates();
    test_telegram_client_urls();
    test_dispatcher_serializes_sessions();
}
