#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "clipferry/bot/http_client.hpp"
#include "clipferry/bot/telegram_protocol.hpp"

namespace clipferry::bot
{

    class TelegramError : public std::runtime_error
    {
    public:
        TelegramError(std::string message, std::optional<int> error_code);

        std::optional<int> error_code() const noexcept { return error_code_; }

    private:
        std::optional<int> error_code_;
    };

    // Thin Bot API client. Every method throws HttpError or TelegramError on failure.
    class TelegramClient
    {
    public:
        TelegramClient(const HttpClient &http, std::string api_base_url, std::string token);

        std::vector<telegram::Update> get_updates(std::int64_t offset, std::chrono::seconds poll_timeout) const;

        void send_message(std::int64_t chat_id, const std::string &text, std::chrono::seconds timeout) const;

        void send_file(std::int64_t chat_id, const std::filesystem::path &path, engine::DeliveryKind kind,
                       const std::string &caption, std::chrono::seconds timeout) const;

        std::string method_url(std::string_view method) const;

    private:
        telegram::ApiResponse check(const HttpResponse &response, std::string_view method) const;

        const HttpClient &http_;
        std::string api_base_url_;
        std::string token_;
    };

} // namespace clipferry::bot
