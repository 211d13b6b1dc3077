#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "resumable/error_codes.hpp"
#include "resumable/server/config.hpp"
#include "resumable/server/deleter.hpp"
#include "resumable/server/filesystem.hpp"
#include "resumable/server/identity.hpp"
#include "resumable/server/upload_state_manager.hpp"
#include "resumable/version.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    using resumable::server::UploadStateManager;

    void print_usage(const char *program_name)
    {
        std::cout << "Resumable upload state tool " << resumable::version() << "\n"
                  << "Usage: " << program_name
                  << " --root <ROOT> [--client <ID>] [--idle-expiry <seconds>] [--overflow-policy alert|clamp|reject]\n"
                     "       [--queue-capacity <N>] [--deleter-threads <N>] [--recover-corrupt] [--log <FILE>]\n"
                     "       <command> [args]\n"
                     "Commands:\n"
                     "  issue                     print a fresh client identifier\n"
                     "  show                      print the client's upload state\n"
                     "  track <file> <size>       start tracking a file\n"
                     "  record <file> <bytes>     add validated bytes to a file\n"
                     "  clear-file <file>         forget a file and delete its data\n"
                     "  clear                     forget the client entirely\n";
    }

    void expect_arguments(const std::vector<std::string> &arguments, std::size_t count, const std::string &command)
    {
        if (arguments.size() != count)
        {
            throw resumable::UploadStateError(resumable::ErrorCode::InvalidArgument,
                                              command + " expects " + std::to_string(count) + " argument(s)");
        }
    }

    void print_state(UploadStateManager &manager)
    {
        auto entity = manager.get_entity();
        std::cout << entity->snapshot().dump(2) << std::endl;
    }

    int dispatch(UploadStateManager &manager, const std::string &client, const std::string &command,
                 const std::vector<std::string> &arguments)
    {
        if (command == "show")
        {
            expect_arguments(arguments, 0, command);
            print_state(manager);
        }
        else if (command == "track")
        {
            expect_arguments(arguments, 2, command);
            manager.track_file(arguments[0], std::stoull(arguments[1]));
            print_state(manager);
        }
        else if (command == "record")
        {
            expect_arguments(arguments, 2, command);
            manager.get_entity();
            const auto result = manager.record_validated_bytes(client, arguments[0], std::stoull(arguments[1]));
            nlohmann::json output{
                {"file_id", arguments[0]},
                {"crced_bytes", result.crced_bytes},
                {"original_file_size_in_bytes", result.original_file_size_in_bytes},
                {"overflow", result.overflow},
                {"status", std::string(resumable::to_string(result.status))},
                {"applied", result.applied},
            };
            std::cout << output.dump(2) << std::endl;
            return result.applied ? EXIT_SUCCESS : EXIT_FAILURE;
        }
        else if (command == "clear-file")
        {
            expect_arguments(arguments, 1, command);
            manager.clear_file(client, arguments[0]);
            print_state(manager);
        }
        else if (command == "clear")
        {
            expect_arguments(arguments, 0, command);
            manager.clear();
        }
        else
        {
            throw resumable::UploadStateError(resumable::ErrorCode::InvalidArgument, "Unknown command: " + command);
        }
        return EXIT_SUCCESS;
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace resumable::server;

    ToolConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.command == "issue")
    {
        std::cout << ThreadIdentityResolver::issue() << std::endl;
        return EXIT_SUCCESS;
    }
    if (!config.client)
    {
        std::cerr << "Missing --client for command " << config.command << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        // stdout carries command output.
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (config.state.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.state.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("resumable", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);

        ThreadIdentityResolver identity;
        DirectoryPathResolver paths(config.state.root, identity);
        AsyncDeleter deleter(config.state.deleter_threads);
        int status = EXIT_SUCCESS;
        {
            UploadStateManager manager(ManagerServices{identity, paths, deleter}, config.state);
            IdentityScope scope(identity, *config.client);
            status = dispatch(manager, *config.client, config.command, config.arguments);
            manager.flush();
        }
        deleter.wait_idle();
        return status;
    }
    catch (const resumable::UploadStateError &ex)
    {
        spdlog::error("{} ({})", ex.what(), resumable::to_string(ex.code()));
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
