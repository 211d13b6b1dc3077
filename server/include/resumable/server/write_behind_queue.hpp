#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace resumable::server
{

    /**
     * Single worker running persistence jobs one at a time in submission order.
     *
     * At most one job per key waits in the queue: submitting for a key that is
     * already pending replaces that job in place. The number of pending keys is
     * bounded by the capacity. Destruction runs the remaining backlog first.
     */
    class WriteBehindQueue
    {
    public:
        using Job = std::function<void()>;

        explicit WriteBehindQueue(std::size_t capacity);
        ~WriteBehindQueue();

        WriteBehindQueue(const WriteBehindQueue &) = delete;
        WriteBehindQueue &operator=(const WriteBehindQueue &) = delete;

        // Returns false, leaving the queue unchanged, when a new key would exceed the capacity.
        bool submit(const std::string &key, Job job);

        // Drops the pending job for `key`; a job already running is not affected.
        bool cancel(const std::string &key);

        // Blocks until nothing is queued or running.
        void drain();

        std::size_t pending() const;
        std::size_t capacity() const noexcept { return capacity_; }

    private:
        void run();

        std::size_t capacity_;
        mutable std::mutex mutex_;
        std::condition_variable work_cv_;
        std::condition_variable idle_cv_;
        std::deque<std::string> order_;
        std::unordered_map<std::string, Job> jobs_;
        bool busy_{false};
        bool stopping_{false};
        std::thread worker_;
    };

} // namespace resumable::server
