#include "resumable/server/upload_state.hpp"

#include "resumable/error_codes.hpp"

namespace resumable::server
{

    void to_json(nlohmann::json &json, const FileUploadState &state)
    {
        json = {
            {"file_id", state.file_id},
            {"crced_bytes", state.crced_bytes},
            {"original_file_size_in_bytes", state.original_file_size_in_bytes},
            {"last_update", std::chrono::duration_cast<std::chrono::seconds>(state.last_update.time_since_epoch()).count()},
        };
    }

    void from_json(const nlohmann::json &json, FileUploadState &state)
    {
        state.file_id = json.at("file_id").get<std::string>();
        state.crced_bytes = json.at("crced_bytes").get<std::uint64_t>();
        state.original_file_size_in_bytes = json.at("original_file_size_in_bytes").get<std::uint64_t>();
        const auto seconds = json.value("last_update", 0LL);
        state.last_update = std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
    }

    std::vector<FileUploadState> UploadState::files() const
    {
        std::lock_guard lock(mutex_);
        std::vector<FileUploadState> result;
        result.reserve(files_.size());
        for (const auto &[id, state] : files_)
        {
            result.push_back(state);
        }
        return result;
    }

    std::optional<FileUploadState> UploadState::file(const std::string &file_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = files_.find(file_id);
        if (it == files_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t UploadState::file_count() const
    {
        std::lock_guard lock(mutex_);
        return files_.size();
    }

    void UploadState::track_file(const std::string &file_id, std::uint64_t size)
    {
        try
        {
            (void)nlohmann::json(file_id).dump();
        }
        catch (const nlohmann::json::type_error &)
        {
            throw UploadStateError(ErrorCode::InvalidArgument, "File identifier is not valid UTF-8");
        }
        std::lock_guard lock(mutex_);
        auto &state = files_[file_id];
        state.file_id = file_id;
        state.original_file_size_in_bytes = size;
    }

    bool UploadState::remove_file(const std::string &file_id)
    {
        std::lock_guard lock(mutex_);
        return files_.erase(file_id) > 0;
    }

    bool UploadState::update_file(const std::string &file_id,
                                  const std::function<void(FileUploadState &)> &mutation)
    {
        std::lock_guard lock(mutex_);
        auto it = files_.find(file_id);
        if (it == files_.end())
        {
            return false;
        }
        mutation(it->second);
        return true;
    }

    nlohmann::json UploadState::snapshot() const
    {
        std::lock_guard lock(mutex_);
        nlohmann::json files = nlohmann::json::object();
        for (const auto &[id, state] : files_)
        {
            files[id] = state;
        }
        nlohmann::json extensions = nlohmann::json::object();
        write_extensions(extensions);
        return {{"files", std::move(files)}, {"extensions", std::move(extensions)}};
    }

    void UploadState::restore(const nlohmann::json &body)
    {
        std::map<std::string, FileUploadState> restored;
        for (const auto &[id, item] : body.at("files").items())
        {
            auto state = item.get<FileUploadState>();
            if (state.file_id != id)
            {
                throw UploadStateError(ErrorCode::CorruptArtifact,
                                       "File entry keyed as '" + id + "' names '" + state.file_id + "'");
            }
            restored.emplace(id, std::move(state));
        }

        std::lock_guard lock(mutex_);
        files_ = std::move(restored);
        read_extensions(body.value("extensions", nlohmann::json::object()));
    }

    void UploadState::write_extensions(nlohmann::json & /*extensions*/) const {}

    void UploadState::read_extensions(const nlohmann::json & /*extensions*/) {}

    EntityFactory default_entity_factory()
    {
        return []
        { return std::make_shared<UploadState>(); };
    }

} // namespace resumable::server
