/**
 * @file hublink_main.cpp
 * @brief hublink-cli: discover a hub, list its devices and activities, send commands.
 *
 * ## Usage
 *
 *     hublink-cli [--config <path.json>] [--refresh] discover
 *     hublink-cli [--config <path.json>] [--refresh] devices
 *     hublink-cli [--config <path.json>] [--refresh] activities
 *     hublink-cli [--config <path.json>] start <activity-id>
 *     hublink-cli [--config <path.json>] exec <device-id> <command-id>
 *     hublink-cli [--config <path.json>] clear-cache
 *
 * Exit status is 0 on success, 1 on usage or configuration errors and 2 when the
 * hub operation failed.
 */
#include "hbl_hub.hpp"
#include "hub/zmq_transport.hpp"

#include <algorithm>
#include <iostream>
#include <string_view>
#include <vector>

using hublink::hub::HubError;
using hublink::utils::Logger;

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

namespace
{

struct CliArgs
{
    std::string config_path;
    bool refresh{false};
    std::string command;
    std::vector<std::string> operands;
};

void print_usage(const char *prog)
{
    std::cout
        << "Usage:\n"
        << "  " << prog << " [options] <command> [operands]\n\n"
        << "Commands:\n"
        << "  discover                      List hubs announcing on the network\n"
        << "  devices                       List devices and their commands\n"
        << "  activities                    List activities (current one marked with *)\n"
        << "  start <activity-id>           Start an activity (-1 powers everything off)\n"
        << "  exec <device-id> <command-id> Send one command to a device\n"
        << "  clear-cache                   Forget cached hub data and drop the session\n\n"
        << "Options:\n"
        << "  --config <path>   Configuration file (overrides hublink.default/user.json)\n"
        << "  --refresh         Bypass the cache and reload data from the hub\n"
        << "  --help            Show this message\n";
}

size_t expected_operands(const std::string &command)
{
    if (command == "start")
        return 1;
    if (command == "exec")
        return 2;
    return 0;
}

CliArgs parse_args(int argc, char *argv[])
{
    CliArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--config" && i + 1 < argc)
        {
            args.config_path = argv[++i];
        }
        else if (arg == "--refresh")
        {
            args.refresh = true;
        }
        else if (!arg.empty() && arg[0] == '-' && arg != "-1")
        {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
        else if (args.command.empty())
        {
            args.command = std::string(arg);
        }
        else
        {
            args.operands.emplace_back(arg);
        }
    }

    static const std::vector<std::string> kCommands = {"discover", "devices", "activities",
                                                       "start",    "exec",    "clear-cache"};
    if (std::find(kCommands.begin(), kCommands.end(), args.command) == kCommands.end())
    {
        std::cerr << (args.command.empty() ? std::string("Error: no command given")
                                           : "Unknown command: " + args.command)
                  << "\n\n";
        print_usage(argv[0]);
        std::exit(1);
    }
    if (args.operands.size() != expected_operands(args.command))
    {
        std::cerr << "Error: '" << args.command << "' expects "
                  << expected_operands(args.command) << " operand(s)\n\n";
        print_usage(argv[0]);
        std::exit(1);
    }
    return args;
}

// ---------------------------------------------------------------------------
// Console notifications
// ---------------------------------------------------------------------------

class ConsoleNotifications : public hublink::hub::INotificationSink
{
  public:
    void progress(const std::string &message) override { std::cerr << "... " << message << "\n"; }
    void success(const std::string &message) override { std::cerr << "ok  " << message << "\n"; }
    void failure(const std::string &message, const HubError &error) override
    {
        std::cerr << "!!  " << message << ": " << error.what() << " (suggested: "
                  << hublink::hub::to_string(hublink::hub::recovery_action(error)) << ")\n";
    }
};

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int run_command(hublink::hub::HubSession &session, const CliArgs &args)
{
    if (args.command == "discover")
    {
        auto result = session.discover_hubs(
            [](const hublink::hub::Hub &hub)
            {
                std::cout << hub.id << "  " << hub.name << "  " << hub.address << ":" << hub.port
                          << "\n";
            });
        return result.ok() ? 0 : 2;
    }
    if (args.command == "devices")
    {
        const auto data = session.get_session_data(nullptr, args.refresh);
        std::cout << "Hub " << data.hub.name << (data.from_cache ? " (cached)" : "") << "\n";
        for (const auto &device : data.devices)
        {
            std::cout << device.id << "  " << device.label << "  [" << device.type << "]\n";
            for (const auto &command : device.commands)
            {
                std::cout << "    " << command.id << "  " << command.label;
                if (command.group)
                    std::cout << "  (" << *command.group << ")";
                std::cout << "\n";
            }
        }
        return 0;
    }
    if (args.command == "activities")
    {
        const auto data = session.get_session_data(nullptr, args.refresh);
        for (const auto &activity : data.activities)
        {
            std::cout << (activity.is_current ? "* " : "  ") << activity.id << "  "
                      << activity.label << "\n";
        }
        return 0;
    }
    if (args.command == "start")
    {
        static_cast<void>(session.get_session_data(nullptr, args.refresh));
        session.start_activity(args.operands[0]);
        return 0;
    }
    if (args.command == "exec")
    {
        static_cast<void>(session.get_session_data(nullptr, args.refresh));
        const auto result = session.execute_command(args.operands[0], args.operands[1]);
        std::cout << hublink::hub::to_string(result.status) << " after " << result.attempts
                  << " attempt(s)\n";
        return result.status == hublink::hub::CommandStatus::Completed ? 0 : 2;
    }
    session.clear_cache();
    std::cout << "Cache cleared\n";
    return 0;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    const CliArgs args = parse_args(argc, argv);

    // ── Load config ───────────────────────────────────────────────────────────
    hublink::hub::SessionConfig config;
    try
    {
        config = hublink::hub::SessionConfig::load({}, args.config_path);
    }
    catch (const HubError &e)
    {
        std::cerr << "Config error: " << e.describe() << "\n";
        Logger::instance().shutdown();
        return 1;
    }

    // ── Logging ───────────────────────────────────────────────────────────────
    auto &logger = Logger::instance();
    logger.set_level(Logger::level_from_string(config.logging.level).value_or(Logger::Level::L_INFO));
    if (!config.logging.file.empty() && !logger.set_logfile(config.logging.file))
        std::cerr << "Warning: cannot log to '" << config.logging.file << "'\n";

    int status = 0;
    {
        // ── Collaborators ─────────────────────────────────────────────────────
        zmq::context_t context(1);
        hublink::hub::ZmqDiscoveryTransport discovery(context, config.transport.discovery_endpoint,
                                                      config.transport.session_port);
        hublink::hub::ZmqSessionTransport sessions(context, config.transport.session_port);
        hublink::utils::JsonFileStore store(config.store_path);
        ConsoleNotifications notifications;

        hublink::hub::HubSession session(discovery, sessions, store, config, &notifications);
        try
        {
            status = run_command(session, args);
        }
        catch (const HubError &e)
        {
            LOGGER_ERROR("hublink-cli: {}", e.describe());
            std::cerr << "Error: " << e.what() << " (suggested: "
                      << hublink::hub::to_string(hublink::hub::recovery_action(e)) << ")\n";
            status = 2;
        }
        session.disconnect();
    }

    logger.shutdown();
    return status;
}
