#include "resumable/server/state_cache.hpp"

#include <spdlog/spdlog.h>

#include "resumable/error_codes.hpp"

namespace resumable::server
{

    StateCache::StateCache(Loader loader, Clock::duration idle_expiry, TimeSource now)
        : loader_(std::move(loader)), idle_expiry_(idle_expiry), now_(std::move(now))
    {
    }

    StateCache::Entity StateCache::get(const std::string &id)
    {
        std::shared_ptr<Flight> flight;
        bool leader = false;
        {
            std::lock_guard lock(mutex_);
            if (auto hit = lookup_locked(id, now_()))
            {
                return hit;
            }
            auto it = flights_.find(id);
            if (it != flights_.end())
            {
                flight = it->second;
            }
            else
            {
                flight = std::make_shared<Flight>();
                flight->result = flight->promise.get_future().share();
                flights_.emplace(id, flight);
                leader = true;
            }
        }

        if (!leader)
        {
            spdlog::debug("Waiting for in-flight load of upload state {}", id);
            return flight->result.get();
        }

        Entity loaded;
        try
        {
            loaded = loader_(id);
            if (!loaded)
            {
                throw UploadStateError(ErrorCode::InternalError, "Loader produced no upload state for " + id);
            }
        }
        catch (...)
        {
            {
                std::lock_guard lock(mutex_);
                finish_flight_locked(id, flight);
            }
            flight->promise.set_exception(std::current_exception());
            throw;
        }

        {
            std::lock_guard lock(mutex_);
            if (!flight->discard)
            {
                entries_[id] = Slot{loaded, now_()};
            }
            finish_flight_locked(id, flight);
        }
        flight->promise.set_value(loaded);
        return loaded;
    }

    StateCache::Entity StateCache::get_if_present(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        return lookup_locked(id, now_());
    }

    void StateCache::put(const std::string &id, Entity entity)
    {
        std::lock_guard lock(mutex_);
        if (auto it = flights_.find(id); it != flights_.end())
        {
            it->second->discard = true;
        }
        entries_[id] = Slot{std::move(entity), now_()};
    }

    void StateCache::invalidate(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        entries_.erase(id);
        if (auto it = flights_.find(id); it != flights_.end())
        {
            it->second->discard = true;
            flights_.erase(it);
        }
    }

    std::size_t StateCache::cleanup_expired()
    {
        std::lock_guard lock(mutex_);
        const auto now = now_();
        std::size_t dropped = 0;
        for (auto it = entries_.begin(); it != entries_.end();)
        {
            if (now - it->second.last_access >= idle_expiry_)
            {
                spdlog::debug("Evicting idle upload state {}", it->first);
                it = entries_.erase(it);
                ++dropped;
            }
            else
            {
                ++it;
            }
        }
        return dropped;
    }

    std::size_t StateCache::size() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    StateCache::Entity StateCache::lookup_locked(const std::string &id, Clock::time_point now)
    {
        auto it = entries_.find(id);
        if (it == entries_.end())
        {
            return nullptr;
        }
        if (now - it->second.last_access >= idle_expiry_)
        {
            spdlog::debug("Evicting idle upload state {}", id);
            entries_.erase(it);
            return nullptr;
        }
        it->second.last_access = now;
        return it->second.entity;
    }

    void StateCache::finish_flight_locked(const std::string &id, const std::shared_ptr<Flight> &flight)
    {
        auto it = flights_.find(id);
        if (it != flights_.end() && it->second == flight)
        {
            flights_.erase(it);
        }
    }

} // namespace resumable::server
