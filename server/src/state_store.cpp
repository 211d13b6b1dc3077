#include "resumable/server/state_store.hpp"

#include <atomic>
#include <fstream>
#include <functional>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "resumable/crypto.hpp"

namespace resumable::server
{

    namespace
    {
        constexpr auto kTempMarker = ".tmp-";
        constexpr auto kQuarantineSuffix = ".corrupt";

        // Removes the temp file on every exit path unless the rename went through.
        class TempFileGuard
        {
        public:
            explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}

            ~TempFileGuard()
            {
                if (!committed_)
                {
                    std::error_code ec;
                    std::filesystem::remove(path_, ec);
                }
            }

            TempFileGuard(const TempFileGuard &) = delete;
            TempFileGuard &operator=(const TempFileGuard &) = delete;

            const std::filesystem::path &path() const noexcept { return path_; }
            void commit() noexcept { committed_ = true; }

        private:
            std::filesystem::path path_;
            bool committed_{false};
        };

        ReadResult failure(ErrorCode code, const std::filesystem::path &path, const std::string &reason)
        {
            spdlog::error("Upload state cannot be restored from {} ({}): {}", path.string(), to_string(code), reason);
            return {.error = code, .message = reason};
        }

    } // namespace

    std::filesystem::path StateStore::artifact_path(const std::filesystem::path &directory)
    {
        return directory / kArtifactName;
    }

    bool StateStore::is_artifact_name(const std::string &file_name)
    {
        const std::string artifact = kArtifactName;
        return file_name == artifact || file_name.starts_with(artifact + ".");
    }

    bool StateStore::write(const UploadState &entity, const std::filesystem::path &path) const
    {
        TempFileGuard temp(temp_path_for(path));
        try
        {
            auto body = entity.snapshot();
            const auto digest = crypto::hash_text(body.dump());
            const nlohmann::json envelope{
                {"schema", kSchema},
                {"version", kSchemaVersion},
                {"digest", digest},
                {"body", std::move(body)},
            };

            {
                std::ofstream out(temp.path(), std::ios::trunc);
                if (!out.is_open())
                {
                    spdlog::error("Cannot open {} for writing upload state", temp.path().string());
                    return false;
                }
                out << envelope.dump(2);
                out.flush();
                if (!out)
                {
                    spdlog::error("Short write while persisting upload state to {}", temp.path().string());
                    return false;
                }
            }

            std::filesystem::rename(temp.path(), path);
            temp.commit();
            return true;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Cannot write upload state to {}: {}", path.string(), ex.what());
            return false;
        }
    }

    ReadResult StateStore::read(const std::filesystem::path &path, UploadState &into) const
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec))
            {
                return failure(ErrorCode::NotFound, path, "artifact does not exist");
            }
            return failure(ErrorCode::IoFailure, path, "artifact cannot be opened");
        }

        try
        {
            nlohmann::json envelope;
            in >> envelope;
            if (!envelope.is_object())
            {
                return failure(ErrorCode::CorruptArtifact, path, "artifact is not a JSON object");
            }

            const auto schema = envelope.value("schema", std::string{});
            if (schema != kSchema)
            {
                return failure(ErrorCode::SchemaMismatch, path, "unexpected schema '" + schema + "'");
            }
            const auto version = envelope.value("version", 0);
            if (version != kSchemaVersion)
            {
                return failure(ErrorCode::SchemaMismatch, path,
                               "unsupported schema version " + std::to_string(version) + ", expected " +
                                   std::to_string(kSchemaVersion));
            }

            const auto &body = envelope.at("body");
            const auto digest = envelope.at("digest").get<std::string>();
            if (crypto::hash_text(body.dump()) != digest)
            {
                return failure(ErrorCode::CorruptArtifact, path, "digest mismatch");
            }

            into.restore(body);
        }
        catch (const nlohmann::json::exception &ex)
        {
            return failure(ErrorCode::CorruptArtifact, path, ex.what());
        }
        catch (const UploadStateError &ex)
        {
            return failure(ex.code(), path, ex.what());
        }
        return {};
    }

    void StateStore::create(const std::filesystem::path &path) const
    {
        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open())
        {
            spdlog::error("Cannot create upload state file {}", path.string());
            throw UploadStateError(ErrorCode::ArtifactCreateFailed, "Cannot create upload state file " + path.string());
        }
    }

    std::filesystem::path StateStore::quarantine(const std::filesystem::path &path) const
    {
        auto target = path;
        target += kQuarantineSuffix;
        std::error_code ec;
        std::filesystem::rename(path, target, ec);
        if (ec)
        {
            spdlog::error("Cannot move {} aside: {}", path.string(), ec.message());
            return {};
        }
        spdlog::warn("Moved unreadable upload state {} to {}", path.string(), target.string());
        return target;
    }

    std::filesystem::path StateStore::temp_path_for(const std::filesystem::path &path)
    {
        static std::atomic<std::uint64_t> counter{0};
        std::ostringstream suffix;
        suffix << kTempMarker << std::hex << std::hash<std::thread::id>{}(std::this_thread::get_id()) << '-'
               << counter.fetch_add(1, std::memory_order_relaxed);
        auto temp = path;
        temp += suffix.str();
        return temp;
    }

} // namespace resumable::server
