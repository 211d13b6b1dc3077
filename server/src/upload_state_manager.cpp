#include "resumable/server/upload_state_manager.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <vector>

#include <spdlog/spdlog.h>

#include "resumable/crypto.hpp"
#include "resumable/error_codes.hpp"

namespace resumable::server
{

    namespace
    {
        constexpr auto kTrashMarker = ".trash-";
        constexpr std::size_t kTrashSuffixBytes = 8;
    } // namespace

    UploadStateManager::UploadStateManager(ManagerServices services, StateConfig config, EntityFactory factory)
        : services_(services),
          config_(std::move(config)),
          factory_(std::move(factory)),
          factory_selected_(static_cast<bool>(factory_)),
          cache_([this](const std::string &client_id)
                 { return create_or_restore(client_id); },
                 config_.idle_expiry),
          write_queue_(config_.write_queue_capacity)
    {
    }

    UploadStateManager::~UploadStateManager()
    {
        write_queue_.drain();
    }

    bool UploadStateManager::init(EntityFactory factory)
    {
        std::lock_guard lock(factory_mutex_);
        if (factory_selected_ || !factory)
        {
            return false;
        }
        factory_ = std::move(factory);
        factory_selected_ = true;
        return true;
    }

    std::shared_ptr<UploadState> UploadStateManager::get_entity()
    {
        return cache_.get(services_.identity.identifier());
    }

    std::shared_ptr<UploadState> UploadStateManager::get_entity_if_present()
    {
        return get_entity_if_present_with_identifier(services_.identity.identifier());
    }

    std::shared_ptr<UploadState> UploadStateManager::get_entity_if_present_with_identifier(const std::string &client_id)
    {
        return cache_.get_if_present(client_id);
    }

    bool UploadStateManager::process_entity_treatment(const std::shared_ptr<UploadState> &entity)
    {
        if (!entity)
        {
            throw UploadStateError(ErrorCode::InvalidArgument, "No upload state to persist");
        }
        return persist_structural(services_.identity.identifier(), entity);
    }

    bool UploadStateManager::write_entity(const std::string &client_id, const UploadState &entity)
    {
        std::lock_guard lock(entity.write_mutex());
        if (entity.detached())
        {
            spdlog::debug("Skipping write of cleared upload state for {}", client_id);
            return false;
        }
        try
        {
            const auto artifact = StateStore::artifact_path(services_.paths.directory(client_id));
            return store_.write(entity, artifact);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Cannot resolve upload state location for {}: {}", client_id, ex.what());
            return false;
        }
    }

    RecordResult UploadStateManager::record_validated_bytes(const std::string &client_id, const std::string &file_id,
                                                            std::uint64_t delta_bytes)
    {
        auto entity = cache_.get_if_present(client_id);
        if (!entity)
        {
            throw UploadStateError(ErrorCode::NotFound, "No upload state loaded for client " + client_id);
        }

        RecordResult result;
        const auto policy = config_.overflow_policy;
        const bool known = entity->update_file(file_id, [&](FileUploadState &state)
                                               {
            const auto previous = state.crced_bytes;
            const bool wraps = delta_bytes > std::numeric_limits<std::uint64_t>::max() - previous;
            const auto updated = wraps ? std::numeric_limits<std::uint64_t>::max() : previous + delta_bytes;
            result.original_file_size_in_bytes = state.original_file_size_in_bytes;
            if (wraps || updated > state.original_file_size_in_bytes)
            {
                result.overflow = true;
                result.status = ErrorCode::InvariantViolation;
                spdlog::critical("{} + {} validated bytes exceed the {} bytes declared for file {} of client {} (policy {})",
                                 previous, delta_bytes, state.original_file_size_in_bytes, file_id, client_id,
                                 to_string(policy));
                switch (policy)
                {
                case OverflowPolicy::Alert:
                    state.crced_bytes = updated;
                    break;
                case OverflowPolicy::Clamp:
                    state.crced_bytes = std::max(previous, state.original_file_size_in_bytes);
                    break;
                case OverflowPolicy::Reject:
                    result.applied = false;
                    break;
                }
            }
            else
            {
                state.crced_bytes = updated;
            }
            if (state.crced_bytes != previous)
            {
                state.last_update = std::chrono::system_clock::now();
            }
            result.crced_bytes = state.crced_bytes;
            spdlog::debug("{} more bytes validated for file {} of client {}, {} before, {} now", delta_bytes, file_id,
                          client_id, previous, state.crced_bytes); });

        if (!known)
        {
            throw UploadStateError(ErrorCode::NotFound, "File " + file_id + " is not tracked for client " + client_id);
        }
        if (!result.applied)
        {
            return result;
        }

        const bool queued = write_queue_.submit(client_id, [this, client_id, entity]
                                                { write_entity(client_id, *entity); });
        if (!queued)
        {
            spdlog::warn("Write-behind queue full ({} clients pending), persisting {} synchronously",
                         write_queue_.capacity(), client_id);
            result.queued = false;
            write_entity(client_id, *entity);
        }
        return result;
    }

    void UploadStateManager::clear_file(const std::string &client_id, const std::string &file_id)
    {
        if (file_id.empty())
        {
            throw UploadStateError(ErrorCode::InvalidArgument, "Cannot clear a file without identifier");
        }
        spdlog::info("Clearing file {} of client {} and everything linked to it", file_id, client_id);

        const auto directory = services_.paths.directory(client_id);
        std::vector<std::filesystem::path> targets;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(directory, ec))
        {
            const auto name = entry.path().filename().string();
            if (name.starts_with(file_id) && !StateStore::is_artifact_name(name))
            {
                targets.push_back(entry.path());
            }
        }
        if (ec)
        {
            spdlog::error("Cannot list {} while clearing file {}: {}", directory.string(), file_id, ec.message());
        }
        services_.deleter.delete_paths(targets);

        auto entity = cache_.get(client_id);
        entity->remove_file(file_id);
        persist_structural(client_id, entity);
    }

    void UploadStateManager::clear()
    {
        const auto client_id = services_.identity.identifier();
        spdlog::info("Clearing upload state, cache entry, identifier and files of client {}", client_id);

        write_queue_.cancel(client_id);
        const auto directory = services_.paths.directory(client_id);
        std::filesystem::path doomed;
        if (auto entity = cache_.get_if_present(client_id))
        {
            std::lock_guard lock(entity->write_mutex());
            entity->detach();
            doomed = detach_directory(directory);
        }
        else
        {
            doomed = detach_directory(directory);
        }
        services_.deleter.delete_path(doomed);

        cache_.invalidate(client_id);
        services_.identity.clear_identifier();
    }

    void UploadStateManager::track_file(const std::string &file_id, std::uint64_t size)
    {
        if (file_id.empty())
        {
            throw UploadStateError(ErrorCode::InvalidArgument, "Cannot track a file without identifier");
        }
        const auto client_id = services_.identity.identifier();
        auto entity = cache_.get(client_id);
        entity->track_file(file_id, size);
        spdlog::info("Tracking file {} ({} bytes) for client {}", file_id, size, client_id);
        persist_structural(client_id, entity);
    }

    std::optional<FileUploadState> UploadStateManager::file_state(const std::string &client_id,
                                                                  const std::string &file_id)
    {
        auto entity = cache_.get_if_present(client_id);
        if (!entity)
        {
            return std::nullopt;
        }
        return entity->file(file_id);
    }

    void UploadStateManager::flush()
    {
        write_queue_.drain();
    }

    std::size_t UploadStateManager::cleanup_expired()
    {
        return cache_.cleanup_expired();
    }

    std::shared_ptr<UploadState> UploadStateManager::create_or_restore(const std::string &client_id)
    {
        const auto directory = services_.paths.directory(client_id);
        const auto artifact = StateStore::artifact_path(directory);

        std::error_code ec;
        const bool exists = std::filesystem::exists(artifact, ec);
        if (ec)
        {
            throw UploadStateError(ErrorCode::IoFailure, "Cannot inspect " + artifact.string() + ": " + ec.message());
        }

        if (exists)
        {
            spdlog::debug("No cached upload state for {}, restoring from {}", client_id, artifact.string());
            auto entity = make_entity();
            const auto result = store_.read(artifact, *entity);
            if (result.ok())
            {
                return entity;
            }
            if (result.error != ErrorCode::NotFound)
            {
                if (!config_.recover_corrupt_artifacts || store_.quarantine(artifact).empty())
                {
                    throw UploadStateError(result.error, "Upload state of client " + client_id +
                                                             " cannot be restored: " + result.message);
                }
            }
        }

        spdlog::debug("No upload state for {}, creating a new one", client_id);
        store_.create(artifact);
        auto entity = make_entity();
        if (!write_entity(client_id, *entity))
        {
            std::filesystem::remove(artifact, ec);
            throw UploadStateError(ErrorCode::ArtifactCreateFailed,
                                   "Cannot write initial upload state for client " + client_id);
        }
        return entity;
    }

    std::shared_ptr<UploadState> UploadStateManager::make_entity() const
    {
        EntityFactory factory;
        {
            std::lock_guard lock(factory_mutex_);
            factory = factory_ ? factory_ : default_entity_factory();
        }
        auto entity = factory();
        if (!entity)
        {
            throw UploadStateError(ErrorCode::InternalError, "Entity factory produced no upload state");
        }
        return entity;
    }

    bool UploadStateManager::persist_structural(const std::string &client_id,
                                                const std::shared_ptr<UploadState> &entity)
    {
        if (entity->detached())
        {
            throw UploadStateError(ErrorCode::InvalidArgument,
                                   "Upload state of client " + client_id + " was cleared and cannot be persisted");
        }
        spdlog::debug("Writing upload state for {}", client_id);
        cache_.put(client_id, entity);
        return write_entity(client_id, *entity);
    }

    std::filesystem::path UploadStateManager::detach_directory(const std::filesystem::path &directory) const
    {
        auto trash = directory;
        trash += kTrashMarker + crypto::random_hex(kTrashSuffixBytes);
        std::error_code ec;
        std::filesystem::rename(directory, trash, ec);
        if (ec)
        {
            spdlog::warn("Cannot detach {} before deletion: {}", directory.string(), ec.message());
            return directory;
        }
        return trash;
    }

} // namespace resumable::server
