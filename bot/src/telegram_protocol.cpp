#include "clipferry/bot/telegram_protocol.hpp"

namespace clipferry::bot::telegram
{

    void from_json(const nlohmann::json &json, Chat &chat)
    {
        json.at("id").get_to(chat.id);
    }

    void from_json(const nlohmann::json &json, Message &message)
    {
        json.at("message_id").get_to(message.message_id);
        json.at("chat").get_to(message.chat);
        if (json.contains("text") && json.at("text").is_string())
        {
            message.text = json.at("text").get<std::string>();
        }
        else
        {
            message.text.reset();
        }
    }

    void from_json(const nlohmann::json &json, Update &update)
    {
        json.at("update_id").get_to(update.update_id);
        if (json.contains("message") && json.at("message").is_object())
        {
            update.message = json.at("message").get<Message>();
        }
        else
        {
            update.message.reset();
        }
    }

    void from_json(const nlohmann::json &json, ApiResponse &response)
    {
        response.ok = json.value("ok", false);
        response.result = json.value("result", nlohmann::json{});
        if (json.contains("description") && json.at("description").is_string())
        {
            response.description = json.at("description").get<std::string>();
        }
        if (json.contains("error_code") && json.at("error_code").is_number_integer())
        {
            response.error_code = json.at("error_code").get<int>();
        }
    }

    void to_json(nlohmann::json &json, const SendMessageRequest &request)
    {
        json = {
            {"chat_id", request.chat_id},
            {"text", request.text},
        };
    }

    void to_json(nlohmann::json &json, const GetUpdatesRequest &request)
    {
        json = {
            {"offset", request.offset},
            {"timeout", request.timeout_seconds},
            {"allowed_updates", nlohmann::json::array({"message"})},
        };
    }

    std::string_view upload_method(engine::DeliveryKind kind) noexcept
    {
        return kind == engine::DeliveryKind::Video ? "sendVideo" : "sendAudio";
    }

    std::string_view upload_field(engine::DeliveryKind kind) noexcept
    {
        return kind == engine::DeliveryKind::Video ? "video" : "audio";
    }

} // namespace clipferry::bot::telegram
