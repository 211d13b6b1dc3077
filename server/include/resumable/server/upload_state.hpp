#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace resumable::server
{

    struct FileUploadState
    {
        std::string file_id;
        std::uint64_t crced_bytes{};
        std::uint64_t original_file_size_in_bytes{};
        std::chrono::system_clock::time_point last_update{};
    };

    void to_json(nlohmann::json &json, const FileUploadState &state);
    void from_json(const nlohmann::json &json, FileUploadState &state);

    /**
     * Per-client record of every file being uploaded and its validated-byte progress.
     *
     * All accessors lock the entity, so one instance can be shared by every request
     * of a client. Subclasses persist extra fields through the extension hooks, which
     * run with the entity lock held.
     */
    class UploadState
    {
    public:
        UploadState() = default;
        virtual ~UploadState() = default;

        UploadState(const UploadState &) = delete;
        UploadState &operator=(const UploadState &) = delete;

        std::vector<FileUploadState> files() const;
        std::optional<FileUploadState> file(const std::string &file_id) const;
        std::size_t file_count() const;

        // Registers a file or updates its expected size; progress is kept.
        // Throws UploadStateError(InvalidArgument) for an identifier that is not valid UTF-8.
        void track_file(const std::string &file_id, std::uint64_t size);
        bool remove_file(const std::string &file_id);

        // Runs `mutation` on the file under the entity lock. Returns false for an unknown file.
        bool update_file(const std::string &file_id, const std::function<void(FileUploadState &)> &mutation);

        nlohmann::json snapshot() const;

        // Replaces the content with `body`. Throws nlohmann::json::exception or UploadStateError
        // on a malformed body, leaving the entity untouched.
        void restore(const nlohmann::json &body);

        // Held across snapshot + write so the newest snapshot always lands last.
        std::mutex &write_mutex() const noexcept { return write_mutex_; }

        // A detached entity has lost its artifact; persisting it is skipped.
        void detach() noexcept { detached_.store(true); }
        bool detached() const noexcept { return detached_.load(); }

    protected:
        virtual void write_extensions(nlohmann::json &extensions) const;
        virtual void read_extensions(const nlohmann::json &extensions);

    private:
        mutable std::mutex mutex_;
        mutable std::mutex write_mutex_;
        std::map<std::string, FileUploadState> files_;
        std::atomic<bool> detached_{false};
    };

    using EntityFactory = std::function<std::shared_ptr<UploadState>()>;

    EntityFactory default_entity_factory();

} // namespace resumable::server
