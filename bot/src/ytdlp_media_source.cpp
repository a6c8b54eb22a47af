#include "clipferry/bot/ytdlp_media_source.hpp"

#include <cmath>
#include <optional>

#include <spdlog/spdlog.h>

#include "clipferry/bot/process.hpp"

namespace clipferry::bot
{

    namespace
    {

        std::string string_or_empty(const nlohmann::json &object, const char *key)
        {
            const auto it = object.find(key);
            if (it == object.end() || !it->is_string())
            {
                return {};
            }
            return it->get<std::string>();
        }

        std::optional<double> number_or_none(const nlohmann::json &object, const char *key)
        {
            const auto it = object.find(key);
            if (it == object.end() || !it->is_number())
            {
                return std::nullopt;
            }
            return it->get<double>();
        }

        bool has_codec(const std::string &codec)
        {
            return !codec.empty() && codec != "none";
        }

        bool is_direct_protocol(const std::string &protocol)
        {
            return protocol.empty() || protocol == "https" || protocol == "http";
        }

    } // namespace

    bool looks_like_url(std::string_view reference) noexcept
    {
        const auto has_prefix = [reference](std::string_view prefix)
        {
            return reference.size() > prefix.size() && reference.substr(0, prefix.size()) == prefix;
        };
        if (!has_prefix("http://") && !has_prefix("https://"))
        {
            return false;
        }
        return reference.find_first_of(" \t\r\n") == std::string_view::npos;
    }

    engine::StreamDescriptor descriptor_from_format(const nlohmann::json &format)
    {
        engine::StreamDescriptor descriptor;
        descriptor.source_handle = string_or_empty(format, "url");
        descriptor.container = string_or_empty(format, "ext");

        const auto vcodec = string_or_empty(format, "vcodec");
        const auto acodec = string_or_empty(format, "acodec");
        const auto protocol = string_or_empty(format, "protocol");
        if (is_direct_protocol(protocol) && has_codec(vcodec) && has_codec(acodec))
        {
            descriptor.kind = engine::StreamKind::VideoProgressive;
        }
        else if (is_direct_protocol(protocol) && vcodec == "none" && has_codec(acodec))
        {
            descriptor.kind = engine::StreamKind::AudioOnly;
        }

        if (descriptor.kind != engine::StreamKind::AudioOnly)
        {
            if (const auto height = number_or_none(format, "height"))
            {
                descriptor.resolution_tag = std::to_string(static_cast<long long>(*height)) + "p";
            }
        }
        if (const auto fps = number_or_none(format, "fps"))
        {
            descriptor.fps = static_cast<int>(std::lround(*fps));
        }

        auto size = number_or_none(format, "filesize");
        if (!size)
        {
            size = number_or_none(format, "filesize_approx");
        }
        descriptor.size_bytes = size && *size > 0 ? static_cast<std::uint64_t>(*size) : 0;
        return descriptor;
    }

    engine::MediaRef media_from_info(const std::string &reference, const nlohmann::json &info)
    {
        engine::MediaRef media;
        media.reference = reference;
        media.title = string_or_empty(info, "title");
        if (media.title.empty())
        {
            media.title = reference;
        }
        // yt-dlp lists formats worst to best; streams are kept best first.
        const auto &formats = info.at("formats");
        for (auto it = formats.rbegin(); it != formats.rend(); ++it)
        {
            media.streams.push_back(descriptor_from_format(*it));
        }
        return media;
    }

    YtDlpMediaSource::YtDlpMediaSource(std::string program, std::chrono::seconds timeout)
        : program_(std::move(program)), timeout_(timeout) {}

    Result<engine::MediaRef> YtDlpMediaSource::resolve(const std::string &reference)
    {
        if (!looks_like_url(reference))
        {
            return make_failure(ErrorCode::InvalidReference, "not a http(s) URL");
        }

        ProcessResult result;
        try
        {
            result = run_process(program_, {"-J", "--no-playlist", "--no-warnings", reference}, timeout_);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Cannot run {}: {}", program_, ex.what());
            return make_failure(ErrorCode::MetadataFetchError, ex.what());
        }

        if (result.timed_out)
        {
            return make_failure(ErrorCode::MetadataFetchError, "metadata lookup timed out");
        }
        if (result.exit_code != 0)
        {
            auto detail = last_line(result.standard_error);
            return make_failure(ErrorCode::InvalidReference, detail.empty() ? "lookup failed" : detail);
        }

        try
        {
            return media_from_info(reference, nlohmann::json::parse(result.standard_output));
        }
        catch (const nlohmann::json::exception &ex)
        {
            return make_failure(ErrorCode::MetadataFetchError, std::string("unreadable metadata: ") + ex.what());
        }
    }

    Result<std::vector<engine::StreamDescriptor>> YtDlpMediaSource::enumerate(const engine::MediaRef &media)
    {
        return media.streams;
    }

} // namespace clipferry::bot
