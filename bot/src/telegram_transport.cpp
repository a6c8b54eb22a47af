#include "clipferry/bot/telegram_transport.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

namespace clipferry::bot
{

    namespace
    {

        constexpr std::chrono::seconds kRetryDelay{3};

        std::int64_t chat_id_from(const std::string &session_id)
        {
            std::size_t consumed = 0;
            const auto id = std::stoll(session_id, &consumed);
            if (consumed != session_id.size())
            {
                throw std::invalid_argument("not a chat id: " + session_id);
            }
            return id;
        }

    } // namespace

    std::vector<engine::InboundMessage> collect_messages(const std::vector<telegram::Update> &updates,
                                                         std::int64_t &offset)
    {
        std::vector<engine::InboundMessage> messages;
        for (const auto &update : updates)
        {
            offset = std::max(offset, update.update_id + 1);
            if (!update.message || !update.message->text)
            {
                continue;
            }
            messages.push_back(engine::InboundMessage{
                .session_id = std::to_string(update.message->chat.id),
                .text = *update.message->text,
            });
        }
        return messages;
    }

    TelegramInbox::TelegramInbox(const TelegramClient &client) : client_(client) {}

    std::vector<engine::InboundMessage> TelegramInbox::poll(std::chrono::seconds wait)
    {
        try
        {
            return collect_messages(client_.get_updates(offset_, wait), offset_);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Polling for updates failed: {}", ex.what());
            std::this_thread::sleep_for(kRetryDelay);
            return {};
        }
    }

    TelegramOutbox::TelegramOutbox(const TelegramClient &client, std::chrono::seconds reply_timeout)
        : client_(client), reply_timeout_(reply_timeout) {}

    void TelegramOutbox::send_reply(const std::string &session_id, const std::string &text)
    {
        try
        {
            client_.send_message(chat_id_from(session_id), text, reply_timeout_);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Reply to {} failed: {}", session_id, ex.what());
        }
    }

    Status TelegramOutbox::deliver_file(const std::string &session_id, const std::filesystem::path &path,
                                        engine::DeliveryKind kind, const std::string &caption,
                                        std::chrono::seconds timeout)
    {
        try
        {
            client_.send_file(chat_id_from(session_id), path, kind, caption, timeout);
            return ok_status();
        }
        catch (const std::exception &ex)
        {
            return make_failure(ErrorCode::DeliveryError, ex.what());
        }
    }

} // namespace clipferry::bot
