#include "clipferry/bot/ffmpeg_transcoder.hpp"

#include <spdlog/spdlog.h>

#include "clipferry/bot/process.hpp"

namespace clipferry::bot
{

    FfmpegTranscoder::FfmpegTranscoder(std::string program) : program_(std::move(program)) {}

    std::vector<std::string> FfmpegTranscoder::mp3_arguments(const std::filesystem::path &input,
                                                             const std::filesystem::path &output,
                                                             unsigned bitrate_kbps)
    {
        return {
            "-y",
            "-loglevel", "error",
            "-i", input.string(),
            "-vn",
            "-codec:a", "libmp3lame",
            "-b:a", std::to_string(bitrate_kbps) + "k",
            "-f", "mp3",
            output.string(),
        };
    }

    Status FfmpegTranscoder::to_mp3(const std::filesystem::path &input, const std::filesystem::path &output,
                                    unsigned bitrate_kbps, std::chrono::seconds timeout)
    {
        ProcessResult result;
        try
        {
            result = run_process(program_, mp3_arguments(input, output, bitrate_kbps), timeout);
        }
        catch (const std::exception &ex)
        {
            return make_failure(ErrorCode::TranscodeError, ex.what());
        }

        if (result.timed_out)
        {
            return make_failure(ErrorCode::TranscodeError, "conversion timed out");
        }
        if (result.exit_code != 0)
        {
            const auto detail = last_line(result.standard_error);
            spdlog::warn("{} exited with {}: {}", program_, result.exit_code, detail);
            return make_failure(ErrorCode::TranscodeError,
                                detail.empty() ? "ffmpeg exited with code " + std::to_string(result.exit_code) : detail);
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(output, ec))
        {
            return make_failure(ErrorCode::TranscodeError, "ffmpeg produced no output file");
        }
        return ok_status();
    }

} // namespace clipferry::bot
