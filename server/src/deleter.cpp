#include "resumable/server/deleter.hpp"

#include <asio/post.hpp>

#include <spdlog/spdlog.h>

namespace resumable::server
{

    AsyncDeleter::AsyncDeleter(std::size_t threads)
        : pool_(threads == 0 ? 1 : threads)
    {
    }

    AsyncDeleter::~AsyncDeleter()
    {
        wait_idle();
        pool_.join();
    }

    void AsyncDeleter::delete_path(const std::filesystem::path &path)
    {
        schedule({path});
    }

    void AsyncDeleter::delete_paths(const std::vector<std::filesystem::path> &paths)
    {
        if (paths.empty())
        {
            return;
        }
        schedule(paths);
    }

    void AsyncDeleter::wait_idle()
    {
        std::unique_lock lock(mutex_);
        idle_cv_.wait(lock, [this]
                      { return pending_ == 0; });
    }

    void AsyncDeleter::schedule(std::vector<std::filesystem::path> paths)
    {
        {
            std::lock_guard lock(mutex_);
            ++pending_;
        }
        asio::post(pool_, [this, paths = std::move(paths)]
                   {
            for (const auto &path : paths)
            {
                std::error_code ec;
                const auto removed = std::filesystem::remove_all(path, ec);
                if (ec)
                {
                    spdlog::warn("Failed to delete {}: {}", path.string(), ec.message());
                }
                else
                {
                    spdlog::debug("Deleted {} ({} entries)", path.string(), removed);
                }
            }
            std::lock_guard lock(mutex_);
            if (--pending_ == 0)
            {
                idle_cv_.notify_all();
            } });
    }

} // namespace resumable::server
