#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "clipferry/engine/media.hpp"
#include "clipferry/error_codes.hpp"

namespace clipferry::engine
{

    struct InboundMessage
    {
        std::string session_id;
        std::string text;
    };

    class Inbox
    {
    public:
        virtual ~Inbox() = default;

        // Blocks for at most wait and returns the messages received meanwhile.
        virtual std::vector<InboundMessage> poll(std::chrono::seconds wait) = 0;
    };

    class Outbox
    {
    public:
        virtual ~Outbox() = default;

        // Best effort. Transport failures are logged by the implementation.
        virtual void send_reply(const std::string &session_id, const std::string &text) = 0;

        // Fails with DeliveryError.
        virtual Status deliver_file(const std::string &session_id, const std::filesystem::path &path,
                                    DeliveryKind kind, const std::string &caption,
                                    std::chrono::seconds timeout) = 0;
    };

} // namespace clipferry::engine
