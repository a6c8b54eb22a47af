#include "clipferry/bot/curl_stream_fetcher.hpp"

#include <spdlog/spdlog.h>

namespace clipferry::bot
{

    CurlStreamFetcher::CurlStreamFetcher(const HttpClient &http) : http_(http) {}

    Status CurlStreamFetcher::fetch(const std::string &source_handle, const std::filesystem::path &destination,
                                    std::chrono::seconds timeout)
    {
        if (source_handle.empty())
        {
            return make_failure(ErrorCode::DownloadError, "stream has no source URL");
        }
        try
        {
            const auto status = http_.download(source_handle, destination, timeout);
            if (status != 200 && status != 206 && status != 0)
            {
                return make_failure(ErrorCode::DownloadError, "HTTP error: " + std::to_string(status));
            }
            spdlog::debug("Fetched {} into {}", source_handle.substr(0, 64), destination.filename().string());
            return ok_status();
        }
        catch (const HttpError &ex)
        {
            return make_failure(ErrorCode::DownloadError, ex.what());
        }
    }

} // namespace clipferry::bot
