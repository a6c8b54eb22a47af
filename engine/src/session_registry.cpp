#include "clipferry/engine/session_registry.hpp"

#include <spdlog/spdlog.h>

namespace clipferry::engine
{

    SessionLease::SessionLease(std::shared_ptr<SessionSlot> slot)
        : slot_(std::move(slot)), lock_(slot_->mutex) {}

    SessionLease SessionRegistry::acquire(const std::string &identity)
    {
        std::shared_ptr<SessionSlot> slot;
        {
            std::lock_guard lock(mutex_);
            auto &entry = slots_[identity];
            if (!entry)
            {
                entry = std::make_shared<SessionSlot>();
                entry->session.id = identity;
                spdlog::debug("Created session {}", identity);
            }
            slot = entry;
        }
        return SessionLease(std::move(slot));
    }

    std::optional<Session> SessionRegistry::snapshot(const std::string &identity) const
    {
        std::shared_ptr<SessionSlot> slot;
        {
            std::lock_guard lock(mutex_);
            auto it = slots_.find(identity);
            if (it == slots_.end())
            {
                return std::nullopt;
            }
            slot = it->second;
        }
        std::lock_guard session_lock(slot->mutex);
        return slot->session;
    }

    bool SessionRegistry::release_if_idle(const std::string &identity)
    {
        std::lock_guard lock(mutex_);
        auto it = slots_.find(identity);
        if (it == slots_.end() || it->second.use_count() > 1)
        {
            return false;
        }
        {
            std::unique_lock session_lock(it->second->mutex, std::try_to_lock);
            if (!session_lock.owns_lock())
            {
                return false;
            }
            const auto &session = it->second->session;
            if (session.state != SessionState::AwaitingUrl || session.media || session.catalog)
            {
                return false;
            }
        }
        slots_.erase(it);
        spdlog::debug("Released idle session {}", identity);
        return true;
    }

    std::size_t SessionRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return slots_.size();
    }

} // namespace clipferry::engine
