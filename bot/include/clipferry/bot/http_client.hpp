#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace clipferry::bot
{

    // Process-wide libcurl initialisation, held by main for the lifetime of the program.
    class CurlGlobal
    {
    public:
        CurlGlobal();
        ~CurlGlobal();

        CurlGlobal(const CurlGlobal &) = delete;
        CurlGlobal &operator=(const CurlGlobal &) = delete;
    };

    class HttpError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct HttpResponse
    {
        long status{};
        std::string body;
    };

    struct FormField
    {
        std::string name;
        std::string value;
        std::optional<std::filesystem::path> file{};
    };

    // Blocking HTTP calls over libcurl. Each call uses its own easy handle, so one client may be
    // shared between threads. Transport failures throw HttpError; HTTP status codes are returned.
    class HttpClient
    {
    public:
        explicit HttpClient(std::string user_agent);

        HttpResponse get(const std::string &url, std::chrono::seconds timeout) const;

        HttpResponse post_json(const std::string &url, const std::string &body, std::chrono::seconds timeout) const;

        HttpResponse post_multipart(const std::string &url, const std::vector<FormField> &fields,
                                    std::chrono::seconds timeout) const;

        // Streams the body into destination and returns the HTTP status.
        long download(const std::string &url, const std::filesystem::path &destination,
                      std::chrono::seconds timeout) const;

    private:
        std::string user_agent_;
    };

} // namespace clipferry::bot
