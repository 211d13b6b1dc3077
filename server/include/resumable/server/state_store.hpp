#pragma once

#include <filesystem>
#include <string>

#include "resumable/error_codes.hpp"
#include "resumable/server/upload_state.hpp"

namespace resumable::server
{

    struct ReadResult
    {
        ErrorCode error{ErrorCode::Ok};
        std::string message{};

        bool ok() const noexcept { return error == ErrorCode::Ok; }
    };

    /**
     * Serializes one client's upload state to its artifact.
     *
     * The artifact is a versioned JSON envelope whose body is covered by a
     * BLAKE2b digest. Writes go to a sibling temp file that is renamed over the
     * artifact, so a reader sees either the previous or the new snapshot. The
     * store does no locking of its own.
     */
    class StateStore
    {
    public:
        static constexpr auto kArtifactName = "upload_state.json";
        static constexpr auto kSchema = "resumable.upload_state";
        static constexpr int kSchemaVersion = 1;

        static std::filesystem::path artifact_path(const std::filesystem::path &directory);

        // True for the artifact and its in-progress or quarantined siblings.
        static bool is_artifact_name(const std::string &file_name);

        // Logs and returns false on failure; never throws.
        bool write(const UploadState &entity, const std::filesystem::path &path) const;

        // Fills `into` on success; `into` is untouched on failure.
        ReadResult read(const std::filesystem::path &path, UploadState &into) const;

        // Creates an empty artifact file. Throws UploadStateError(ArtifactCreateFailed).
        void create(const std::filesystem::path &path) const;

        // Moves a bad artifact aside; returns the new location or an empty path.
        std::filesystem::path quarantine(const std::filesystem::path &path) const;

    private:
        static std::filesystem::path temp_path_for(const std::filesystem::path &path);
    };

} // namespace resumable::server
