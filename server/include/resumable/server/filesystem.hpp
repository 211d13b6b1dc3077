#pragma once

#include <filesystem>
#include <string>

#include "resumable/server/collaborators.hpp"

namespace resumable::server
{

    /**
     * Lays client state out as `<root>/clients/<identifier>`.
     */
    class DirectoryPathResolver : public PathResolver
    {
    public:
        DirectoryPathResolver(std::filesystem::path root, IdentityResolver &identity);

        std::filesystem::path directory() override;
        std::filesystem::path directory(const std::string &identifier) override;

    private:
        std::filesystem::path base_;
        IdentityResolver &identity_;

        std::filesystem::path sanitize(const std::string &identifier) const;
    };

} // namespace resumable::server
