#include "resumable/server/filesystem.hpp"

#include "resumable/error_codes.hpp"

namespace resumable::server
{

    namespace
    {
        constexpr auto kClientsDir = "clients";
    } // namespace

    DirectoryPathResolver::DirectoryPathResolver(std::filesystem::path root, IdentityResolver &identity)
        : base_(std::move(root) / kClientsDir), identity_(identity)
    {
        std::filesystem::create_directories(base_);
    }

    std::filesystem::path DirectoryPathResolver::directory()
    {
        return directory(identity_.identifier());
    }

    std::filesystem::path DirectoryPathResolver::directory(const std::string &identifier)
    {
        auto path = sanitize(identifier);
        std::filesystem::create_directories(path);
        return path;
    }

    std::filesystem::path DirectoryPathResolver::sanitize(const std::string &identifier) const
    {
        if (identifier.empty() || identifier == "." || identifier == "..")
        {
            throw UploadStateError(ErrorCode::InvalidArgument, "Invalid client identifier '" + identifier + "'");
        }
        if (identifier.find_first_of("/\\") != std::string::npos || identifier.find('\0') != std::string::npos)
        {
            throw UploadStateError(ErrorCode::InvalidArgument, "Path traversal detected in client identifier");
        }
        return base_ / identifier;
    }

} // namespace resumable::server
