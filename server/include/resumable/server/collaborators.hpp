#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace resumable::server
{

    class IdentityResolver
    {
    public:
        virtual ~IdentityResolver() = default;

        // Stable, non-empty identifier of the current caller.
        virtual std::string identifier() = 0;
        virtual void clear_identifier() = 0;
    };

    class PathResolver
    {
    public:
        virtual ~PathResolver() = default;

        // Directory of the current caller, created if missing.
        virtual std::filesystem::path directory() = 0;
        // Directory of an arbitrary client, created if missing.
        virtual std::filesystem::path directory(const std::string &identifier) = 0;
    };

    /**
     * Schedules best-effort deletion. Calls return immediately; missing targets
     * are not an error.
     */
    class Deleter
    {
    public:
        virtual ~Deleter() = default;

        virtual void delete_path(const std::filesystem::path &path) = 0;
        virtual void delete_paths(const std::vector<std::filesystem::path> &paths) = 0;
    };

} // namespace resumable::server
