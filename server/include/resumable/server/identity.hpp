#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "resumable/server/collaborators.hpp"

namespace resumable::server
{

    /**
     * Identifier bound to the calling thread, the way a request handler thread
     * carries the client of the request it serves. A thread with no binding is
     * issued a fresh random identifier on first use.
     */
    class ThreadIdentityResolver : public IdentityResolver
    {
    public:
        std::string identifier() override;
        void clear_identifier() override;

        void bind(std::string identifier);
        std::optional<std::string> current() const;

        static std::string issue();

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::thread::id, std::string> bindings_;
    };

    // Binds an identifier for the lifetime of the scope and restores the previous one.
    class IdentityScope
    {
    public:
        IdentityScope(ThreadIdentityResolver &resolver, std::string identifier);
        ~IdentityScope();

        IdentityScope(const IdentityScope &) = delete;
        IdentityScope &operator=(const IdentityScope &) = delete;

    private:
        ThreadIdentityResolver &resolver_;
        std::optional<std::string> previous_;
    };

} // namespace resumable::server
