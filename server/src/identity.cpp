#include "resumable/server/identity.hpp"

#include <spdlog/spdlog.h>

#include "resumable/crypto.hpp"

namespace resumable::server
{

    namespace
    {
        constexpr std::size_t kIdentifierBytes = 16;
    } // namespace

    std::string ThreadIdentityResolver::identifier()
    {
        std::lock_guard lock(mutex_);
        auto &bound = bindings_[std::this_thread::get_id()];
        if (bound.empty())
        {
            bound = issue();
            spdlog::debug("Issued client identifier {}", bound);
        }
        return bound;
    }

    void ThreadIdentityResolver::clear_identifier()
    {
        std::lock_guard lock(mutex_);
        bindings_.erase(std::this_thread::get_id());
    }

    void ThreadIdentityResolver::bind(std::string identifier)
    {
        std::lock_guard lock(mutex_);
        bindings_[std::this_thread::get_id()] = std::move(identifier);
    }

    std::optional<std::string> ThreadIdentityResolver::current() const
    {
        std::lock_guard lock(mutex_);
        auto it = bindings_.find(std::this_thread::get_id());
        if (it == bindings_.end() || it->second.empty())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::string ThreadIdentityResolver::issue()
    {
        return crypto::random_hex(kIdentifierBytes);
    }

    IdentityScope::IdentityScope(ThreadIdentityResolver &resolver, std::string identifier)
        : resolver_(resolver), previous_(resolver.current())
    {
        resolver_.bind(std::move(identifier));
    }

    IdentityScope::~IdentityScope()
    {
        if (previous_)
        {
            resolver_.bind(*previous_);
        }
        else
        {
            resolver_.clear_identifier();
        }
    }

} // namespace resumable::server
