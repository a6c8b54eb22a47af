#pragma once

#include "clipferry/bot/http_client.hpp"
#include "clipferry/engine/stream_fetcher.hpp"

namespace clipferry::bot
{

    // Fetches a stream whose source handle is a direct media URL.
    class CurlStreamFetcher : public engine::StreamFetcher
    {
    public:
        explicit CurlStreamFetcher(const HttpClient &http);

        Status fetch(const std::string &source_handle, const std::filesystem::path &destination,
                     std::chrono::seconds timeout) override;

    private:
        const HttpClient &http_;
    };

} // namespace clipferry::bot
