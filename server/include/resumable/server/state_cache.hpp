#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "resumable/server/upload_state.hpp"

namespace resumable::server
{

    /**
     * Upload states keyed by client identifier, dropped after an idle period.
     *
     * A miss runs the loader once per key no matter how many callers arrive
     * concurrently; every caller of that flight gets the same instance, or the
     * same exception when the loader throws. Failed loads are not cached.
     * Eviction never persists anything.
     */
    class StateCache
    {
    public:
        using Entity = std::shared_ptr<UploadState>;
        using Loader = std::function<Entity(const std::string &)>;
        using Clock = std::chrono::steady_clock;
        using TimeSource = std::function<Clock::time_point()>;

        StateCache(Loader loader, Clock::duration idle_expiry, TimeSource now = Clock::now);

        Entity get(const std::string &id);
        Entity get_if_present(const std::string &id);
        void put(const std::string &id, Entity entity);
        void invalidate(const std::string &id);

        // Drops idle entries; returns how many were dropped.
        std::size_t cleanup_expired();
        std::size_t size() const;

    private:
        struct Slot
        {
            Entity entity;
            Clock::time_point last_access;
        };

        struct Flight
        {
            std::promise<Entity> promise;
            std::shared_future<Entity> result;
            bool discard{false};
        };

        Entity lookup_locked(const std::string &id, Clock::time_point now);
        void finish_flight_locked(const std::string &id, const std::shared_ptr<Flight> &flight);

        Loader loader_;
        Clock::duration idle_expiry_;
        TimeSource now_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, Slot> entries_;
        std::unordered_map<std::string, std::shared_ptr<Flight>> flights_;
    };

} // namespace resumable::server
