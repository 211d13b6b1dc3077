#include "resumable/server/write_behind_queue.hpp"

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

namespace resumable::server
{

    WriteBehindQueue::WriteBehindQueue(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity)
    {
        worker_ = std::thread([this]
                              { run(); });
    }

    WriteBehindQueue::~WriteBehindQueue()
    {
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
        }
        work_cv_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    bool WriteBehindQueue::submit(const std::string &key, Job job)
    {
        {
            std::lock_guard lock(mutex_);
            auto it = jobs_.find(key);
            if (it != jobs_.end())
            {
                it->second = std::move(job);
                return true;
            }
            if (jobs_.size() >= capacity_)
            {
                return false;
            }
            jobs_.emplace(key, std::move(job));
            order_.push_back(key);
        }
        work_cv_.notify_one();
        return true;
    }

    bool WriteBehindQueue::cancel(const std::string &key)
    {
        std::lock_guard lock(mutex_);
        if (jobs_.erase(key) == 0)
        {
            return false;
        }
        order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
        if (order_.empty() && !busy_)
        {
            idle_cv_.notify_all();
        }
        return true;
    }

    void WriteBehindQueue::drain()
    {
        std::unique_lock lock(mutex_);
        idle_cv_.wait(lock, [this]
                      { return order_.empty() && !busy_; });
    }

    std::size_t WriteBehindQueue::pending() const
    {
        std::lock_guard lock(mutex_);
        return order_.size();
    }

    void WriteBehindQueue::run()
    {
        while (true)
        {
            std::string key;
            Job job;
            {
                std::unique_lock lock(mutex_);
                work_cv_.wait(lock, [this]
                              { return !order_.empty() || stopping_; });
                if (order_.empty())
                {
                    return;
                }
                key = std::move(order_.front());
                order_.pop_front();
                auto it = jobs_.find(key);
                job = std::move(it->second);
                jobs_.erase(it);
                busy_ = true;
            }

            try
            {
                job();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Write-behind job for {} failed: {}", key, ex.what());
            }

            {
                std::lock_guard lock(mutex_);
                busy_ = false;
                if (order_.empty())
                {
                    idle_cv_.notify_all();
                }
            }
        }
    }

} // namespace resumable::server
