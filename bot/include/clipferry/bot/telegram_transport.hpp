#pragma once

#include <chrono>
#include <cstdint>

#include "clipferry/bot/telegram_client.hpp"
#include "clipferry/engine/transport.hpp"

namespace clipferry::bot
{

    // Session ids are Telegram chat ids in decimal.
    class TelegramInbox : public engine::Inbox
    {
    public:
        explicit TelegramInbox(const TelegramClient &client);

        std::vector<engine::InboundMessage> poll(std::chrono::seconds wait) override;

        std::int64_t next_offset() const noexcept { return offset_; }

    private:
        const TelegramClient &client_;
        std::int64_t offset_{0};
    };

    class TelegramOutbox : public engine::Outbox
    {
    public:
        TelegramOutbox(const TelegramClient &client, std::chrono::seconds reply_timeout);

        void send_reply(const std::string &session_id, const std::string &text) override;

        Status deliver_file(const std::string &session_id, const std::filesystem::path &path,
                            engine::DeliveryKind kind, const std::string &caption,
                            std::chrono::seconds timeout) override;

    private:
        const TelegramClient &client_;
        std::chrono::seconds reply_timeout_;
    };

    // Collects the text messages of a batch of updates and advances offset past them.
    std::vector<engine::InboundMessage> collect_messages(const std::vector<telegram::Update> &updates,
                                                         std::int64_t &offset);

} // namespace clipferry::bot
