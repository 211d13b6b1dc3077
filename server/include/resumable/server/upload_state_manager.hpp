#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "resumable/error_codes.hpp"
#include "resumable/server/collaborators.hpp"
#include "resumable/server/config.hpp"
#include "resumable/server/state_cache.hpp"
#include "resumable/server/state_store.hpp"
#include "resumable/server/upload_state.hpp"
#include "resumable/server/write_behind_queue.hpp"

namespace resumable::server
{

    struct ManagerServices
    {
        IdentityResolver &identity;
        PathResolver &paths;
        Deleter &deleter;
    };

    struct RecordResult
    {
        std::uint64_t crced_bytes{};
        std::uint64_t original_file_size_in_bytes{};
        bool overflow{false};
        // InvariantViolation when validated bytes exceed the declared size.
        ErrorCode status{ErrorCode::Ok};
        // False when the overflow policy refused the delta.
        bool applied{true};
        // False when the write went through synchronously because the queue was full.
        bool queued{true};
    };

    /**
     * Upload state of every client, cached in memory and backed by one artifact
     * per client directory.
     *
     * Structural changes (tracking or clearing a file) are persisted before the
     * call returns. Validated-byte updates are applied in memory immediately and
     * persisted by the write-behind worker.
     */
    class UploadStateManager
    {
    public:
        UploadStateManager(ManagerServices services, StateConfig config, EntityFactory factory = {});
        ~UploadStateManager();

        UploadStateManager(const UploadStateManager &) = delete;
        UploadStateManager &operator=(const UploadStateManager &) = delete;

        // Selects the entity shape once; the first selection wins, including one made at construction.
        bool init(EntityFactory factory);

        std::shared_ptr<UploadState> get_entity();
        std::shared_ptr<UploadState> get_entity_if_present();
        std::shared_ptr<UploadState> get_entity_if_present_with_identifier(const std::string &client_id);

        bool process_entity_treatment(const std::shared_ptr<UploadState> &entity);
        bool write_entity(const std::string &client_id, const UploadState &entity);

        // Requires the client's state to be cached already.
        RecordResult record_validated_bytes(const std::string &client_id, const std::string &file_id,
                                            std::uint64_t delta_bytes);

        void clear_file(const std::string &client_id, const std::string &file_id);
        void clear();

        void track_file(const std::string &file_id, std::uint64_t size);
        std::optional<FileUploadState> file_state(const std::string &client_id, const std::string &file_id);

        void flush();
        std::size_t cleanup_expired();

        const StateConfig &config() const noexcept { return config_; }

    private:
        std::shared_ptr<UploadState> create_or_restore(const std::string &client_id);
        std::shared_ptr<UploadState> make_entity() const;
        bool persist_structural(const std::string &client_id, const std::shared_ptr<UploadState> &entity);
        std::filesystem::path detach_directory(const std::filesystem::path &directory) const;

        ManagerServices services_;
        StateConfig config_;
        StateStore store_;

        mutable std::mutex factory_mutex_;
        EntityFactory factory_;
        bool factory_selected_{false};

        StateCache cache_;
        // Last member: its destructor runs the backlog while everything above is alive.
        WriteBehindQueue write_queue_;
    };

} // namespace resumable::server
