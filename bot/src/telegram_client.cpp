#include "clipferry/bot/telegram_client.hpp"

#include <nlohmann/json.hpp>

namespace clipferry::bot
{

    namespace
    {
        // Long polling keeps the request open for poll_timeout; leave room for the round trip.
        constexpr std::chrono::seconds kPollGrace{10};
    } // namespace

    TelegramError::TelegramError(std::string message, std::optional<int> error_code)
        : std::runtime_error(std::move(message)), error_code_(error_code) {}

    TelegramClient::TelegramClient(const HttpClient &http, std::string api_base_url, std::string token)
        : http_(http), api_base_url_(std::move(api_base_url)), token_(std::move(token))
    {
        while (!api_base_url_.empty() && api_base_url_.back() == '/')
        {
            api_base_url_.pop_back();
        }
    }

    std::string TelegramClient::method_url(std::string_view method) const
    {
        return api_base_url_ + "/bot" + token_ + "/" + std::string(method);
    }

    std::vector<telegram::Update> TelegramClient::get_updates(std::int64_t offset,
                                                              std::chrono::seconds poll_timeout) const
    {
        const nlohmann::json request = telegram::GetUpdatesRequest{
            .offset = offset,
            .timeout_seconds = static_cast<long>(poll_timeout.count()),
        };
        const auto response =
            check(http_.post_json(method_url("getUpdates"), request.dump(), poll_timeout + kPollGrace), "getUpdates");
        if (!response.result.is_array())
        {
            throw TelegramError("getUpdates returned no update list", std::nullopt);
        }
        return response.result.get<std::vector<telegram::Update>>();
    }

    void TelegramClient::send_message(std::int64_t chat_id, const std::string &text, std::chrono::seconds timeout) const
    {
        const nlohmann::json request = telegram::SendMessageRequest{.chat_id = chat_id, .text = text};
        check(http_.post_json(method_url("sendMessage"), request.dump(), timeout), "sendMessage");
    }

    void TelegramClient::send_file(std::int64_t chat_id, const std::filesystem::path &path, engine::DeliveryKind kind,
                                   const std::string &caption, std::chrono::seconds timeout) const
    {
        std::vector<FormField> fields{
            FormField{.name = "chat_id", .value = std::to_string(chat_id)},
            FormField{.name = std::string(telegram::upload_field(kind)), .value = {}, .file = path},
        };
        if (!caption.empty())
        {
            fields.push_back(FormField{.name = "caption", .value = caption});
        }
        const auto method = telegram::upload_method(kind);
        check(http_.post_multipart(method_url(method), fields, timeout), method);
    }

    telegram::ApiResponse TelegramClient::check(const HttpResponse &response, std::string_view method) const
    {
        telegram::ApiResponse api;
        try
        {
            api = nlohmann::json::parse(response.body).get<telegram::ApiResponse>();
        }
        catch (const nlohmann::json::exception &)
        {
            throw TelegramError(std::string(method) + " failed with HTTP " + std::to_string(response.status),
                                static_cast<int>(response.status));
        }
        if (!api.ok)
        {
            throw TelegramError(std::string(method) + ": " + api.description.value_or("request rejected"),
                                api.error_code);
        }
        return api;
    }

} // namespace clipferry::bot
