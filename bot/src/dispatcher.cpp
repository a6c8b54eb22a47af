#include "clipferry/bot/dispatcher.hpp"

#include <asio/post.hpp>

#include <spdlog/spdlog.h>

#include "clipferry/intent.hpp"

namespace clipferry::bot
{

    Dispatcher::Dispatcher(asio::io_context &io_context, engine::ConversationEngine &engine)
        : io_context_(io_context), engine_(engine) {}

    void Dispatcher::dispatch(const engine::InboundMessage &message)
    {
        auto intent = parse_intent(message.text);
        spdlog::debug("Dispatching {} for {}", to_string(intent.kind), message.session_id);
        asio::post(enqueue(message.session_id),
                   [this, session_id = message.session_id, intent = std::move(intent)]
                   {
                       engine_.handle(session_id, intent);
                       complete(session_id);
                   });
    }

    std::size_t Dispatcher::active_strands() const
    {
        std::lock_guard lock(mutex_);
        return lanes_.size();
    }

    Dispatcher::Strand Dispatcher::enqueue(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        auto it = lanes_.find(session_id);
        if (it == lanes_.end())
        {
            it = lanes_.emplace(session_id, Lane{asio::make_strand(io_context_)}).first;
        }
        ++it->second.queued;
        return it->second.strand;
    }

    void Dispatcher::complete(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        auto it = lanes_.find(session_id);
        if (it != lanes_.end() && --it->second.queued == 0)
        {
            lanes_.erase(it);
        }
    }

} // namespace clipferry::bot
