#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resumable::server
{

    // What to do when validated bytes would exceed the declared file size.
    enum class OverflowPolicy : std::uint8_t
    {
        Alert,
        Clamp,
        Reject
    };

    std::string_view to_string(OverflowPolicy policy) noexcept;
    std::optional<OverflowPolicy> overflow_policy_from_string(std::string_view value) noexcept;

    struct StateConfig
    {
        std::filesystem::path root;
        std::chrono::seconds idle_expiry{std::chrono::hours{24}};
        OverflowPolicy overflow_policy{OverflowPolicy::Alert};
        std::size_t write_queue_capacity{4096};
        bool recover_corrupt_artifacts{false};
        std::size_t deleter_threads{1};
        std::optional<std::filesystem::path> log_file;
    };

    struct ToolConfig
    {
        StateConfig state;
        std::optional<std::string> client;
        std::string command;
        std::vector<std::string> arguments;
    };

    ToolConfig parse_arguments(int argc, char *argv[]);

} // namespace resumable::server
