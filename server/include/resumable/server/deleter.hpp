#pragma once

#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <vector>

#include <asio/thread_pool.hpp>

#include "resumable/server/collaborators.hpp"

namespace resumable::server
{

    class AsyncDeleter : public Deleter
    {
    public:
        explicit AsyncDeleter(std::size_t threads = 1);
        ~AsyncDeleter() override;

        AsyncDeleter(const AsyncDeleter &) = delete;
        AsyncDeleter &operator=(const AsyncDeleter &) = delete;

        void delete_path(const std::filesystem::path &path) override;
        void delete_paths(const std::vector<std::filesystem::path> &paths) override;

        // Blocks until every scheduled deletion has run.
        void wait_idle();

    private:
        void schedule(std::vector<std::filesystem::path> paths);

        asio::thread_pool pool_;
        std::mutex mutex_;
        std::condition_variable idle_cv_;
        std::size_t pending_{0};
    };

} // namespace resumable::server
