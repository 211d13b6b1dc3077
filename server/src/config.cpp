#include "resumable/server/config.hpp"

#include <array>
#include <stdexcept>

namespace resumable::server
{

    namespace
    {
        struct OverflowPolicyMapping
        {
            OverflowPolicy policy;
            std::string_view label;
        };

        constexpr std::array<OverflowPolicyMapping, 3> kOverflowPolicies{{
            {OverflowPolicy::Alert, "alert"},
            {OverflowPolicy::Clamp, "clamp"},
            {OverflowPolicy::Reject, "reject"},
        }};

        std::string require_value(int &index, int argc, char *argv[], const std::string &option)
        {
            if (index >= argc)
            {
                throw std::runtime_error(option + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    std::string_view to_string(OverflowPolicy policy) noexcept
    {
        for (const auto &mapping : kOverflowPolicies)
        {
            if (mapping.policy == policy)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<OverflowPolicy> overflow_policy_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kOverflowPolicies)
        {
            if (mapping.label == value)
            {
                return mapping.policy;
            }
        }
        return std::nullopt;
    }

    ToolConfig parse_arguments(int argc, char *argv[])
    {
        ToolConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--root")
            {
                config.state.root = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--client")
            {
                config.client = require_value(index, argc, argv, arg);
            }
            else if (arg == "--idle-expiry")
            {
                config.state.idle_expiry = std::chrono::seconds(std::stoll(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--overflow-policy")
            {
                const auto value = require_value(index, argc, argv, arg);
                const auto policy = overflow_policy_from_string(value);
                if (!policy)
                {
                    throw std::runtime_error("Unknown overflow policy: " + value + " (expected alert, clamp or reject)");
                }
                config.state.overflow_policy = *policy;
            }
            else if (arg == "--queue-capacity")
            {
                config.state.write_queue_capacity =
                    static_cast<std::size_t>(std::stoull(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--deleter-threads")
            {
                config.state.deleter_threads = static_cast<std::size_t>(std::stoull(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--recover-corrupt")
            {
                config.state.recover_corrupt_artifacts = true;
            }
            else if (arg == "--log")
            {
                config.state.log_file = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                config.command = arg;
                while (index < argc)
                {
                    config.arguments.emplace_back(argv[index++]);
                }
            }
        }

        if (config.command.empty())
        {
            throw std::runtime_error("Missing command");
        }
        if (config.state.root.empty() && config.command != "issue")
        {
            throw std::runtime_error("--root is required");
        }
        return config;
    }

} // namespace resumable::server
