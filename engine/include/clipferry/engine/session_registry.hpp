#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "clipferry/engine/session.hpp"

namespace clipferry::engine
{

    struct SessionSlot
    {
        std::mutex mutex;
        Session session;
    };

    // Exclusive access to one session for the duration of an intent.
    class SessionLease
    {
    public:
        explicit SessionLease(std::shared_ptr<SessionSlot> slot);

        Session &session() noexcept { return slot_->session; }
        Session *operator->() noexcept { return &slot_->session; }

    private:
        std::shared_ptr<SessionSlot> slot_;
        std::unique_lock<std::mutex> lock_;
    };

    class SessionRegistry
    {
    public:
        // Creates the session on first contact. Blocks while another intent holds it.
        SessionLease acquire(const std::string &identity);

        // Copy of the session once it is idle, if it exists.
        std::optional<Session> snapshot(const std::string &identity) const;

        // Drops the slot when nothing holds it and the session carries no state past AWAITING_URL.
        bool release_if_idle(const std::string &identity);

        std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<SessionSlot>> slots_;
    };

} // namespace clipferry::engine
