#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

#include <asio/io_context.hpp>
#include <asio/strand.hpp>

#include "clipferry/engine/conversation_engine.hpp"
#include "clipferry/engine/transport.hpp"

namespace clipferry::bot
{

    // Posts inbound messages onto one strand per session: a session's intents run in arrival
    // order, different sessions run in parallel on the io_context threads. A strand is dropped
    // once its last queued intent has run.
    class Dispatcher
    {
    public:
        Dispatcher(asio::io_context &io_context, engine::ConversationEngine &engine);

        void dispatch(const engine::InboundMessage &message);

        std::size_t active_strands() const;

    private:
        using Strand = asio::strand<asio::io_context::executor_type>;

        struct Lane
        {
            Strand strand;
            std::size_t queued{0};
        };

        Strand enqueue(const std::string &session_id);
        void complete(const std::string &session_id);

        asio::io_context &io_context_;
        engine::ConversationEngine &engine_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Lane> lanes_;
    };

} // namespace clipferry::bot
