/**
 * ClipFerry - Telegram Bot API schema subset and JSON mapping.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "clipferry/engine/media.hpp"

namespace clipferry::bot::telegram
{

    struct Chat
    {
        std::int64_t id{};
    };

    void from_json(const nlohmann::json &json, Chat &chat);

    struct Message
    {
        std::int64_t message_id{};
        Chat chat{};
        std::optional<std::string> text{};
    };

    void from_json(const nlohmann::json &json, Message &message);

    struct Update
    {
        std::int64_t update_id{};
        std::optional<Message> message{};
    };

    void from_json(const nlohmann::json &json, Update &update);

    struct ApiResponse
    {
        bool ok{};
        nlohmann::json result{};
        std::optional<std::string> description{};
        std::optional<int> error_code{};
    };

    void from_json(const nlohmann::json &json, ApiResponse &response);

    struct SendMessageRequest
    {
        std::int64_t chat_id{};
        std::string text;
    };

    void to_json(nlohmann::json &json, const SendMessageRequest &request);

    struct GetUpdatesRequest
    {
        std::int64_t offset{};
        long timeout_seconds{};
    };

    void to_json(nlohmann::json &json, const GetUpdatesRequest &request);

    // "sendVideo" / "sendAudio"
    std::string_view upload_method(engine::DeliveryKind kind) noexcept;

    // Multipart field carrying the file: "video" / "audio"
    std::string_view upload_field(engine::DeliveryKind kind) noexcept;

} // namespace clipferry::bot::telegram
