#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <cgfs/cgroup/cgroup_client.hpp>
#include <cgfs/cgroup/tree_view.hpp>
#include <cgfs/config/daemon_config.hpp>
#include <cgfs/core/error.hpp>
#include <cgfs/core/logger.hpp>
#include <cgfs/fs/dispatcher.hpp>
#include <cgfs/fuse/fuse_bridge.hpp>
#include <cgfs/proc/proc_rewriter.hpp>
#include <cgfs/proc/proc_source.hpp>

using namespace cgfs;

namespace {

struct CommandLine {
    std::string config_file;
    std::string mountpoint;
    std::vector<std::string> mount_options;
    bool foreground = false;
    bool single_threaded = false;
    bool debug = false;
    bool help = false;
};

void printUsage(const char* program)
{
    std::cerr << "usage: " << program << " [options] <mountpoint>\n"
              << "\n"
              << "options:\n"
              << "    -c, --config FILE   JSON configuration file\n"
              << "    -f                  stay in the foreground\n"
              << "    -s                  serve requests on a single thread\n"
              << "    -d                  FUSE debug output, implies -f and debug logging\n"
              << "    -o OPTIONS          extra mount options\n"
              << "    -h, --help          show this message\n";
}

CommandLine parseCommandLine(int argc, char* argv[])
{
    CommandLine command_line;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            command_line.help = true;
        }
        else if (arg == "-c" || arg == "--config" || arg == "-o") {
            if (i + 1 >= argc) {
                throw FsError(ErrorCode::CONFIG_INVALID, "Option " + arg + " needs a value");
            }
            if (arg == "-o") {
                command_line.mount_options.emplace_back(argv[++i]);
            }
            else {
                command_line.config_file = argv[++i];
            }
        }
        else if (arg == "-f") {
            command_line.foreground = true;
        }
        else if (arg == "-s") {
            command_line.single_threaded = true;
        }
        else if (arg == "-d") {
            command_line.debug = true;
            command_line.foreground = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            throw FsError(ErrorCode::CONFIG_INVALID, "Unknown option: " + arg);
        }
        else if (command_line.mountpoint.empty()) {
            command_line.mountpoint = arg;
        }
        else {
            throw FsError(ErrorCode::CONFIG_INVALID, "Unexpected argument: " + arg);
        }
    }
    return command_line;
}

DaemonConfig loadConfig(const CommandLine& command_line)
{
    ConfigManager config;
    if (!command_line.config_file.empty()) {
        config.loadFromJsonFile(command_line.config_file);
    }

    DaemonConfig daemon_config = DaemonConfig::fromConfig(config);
    if (!command_line.mountpoint.empty()) {
        daemon_config.mountpoint = command_line.mountpoint;
    }
    daemon_config.foreground = daemon_config.foreground || command_line.foreground;
    daemon_config.single_threaded = daemon_config.single_threaded || command_line.single_threaded;
    if (command_line.debug) {
        daemon_config.log_level = LogLevel::DEBUG;
    }

    if (daemon_config.mountpoint.empty()) {
        throw FsError(ErrorCode::CONFIG_MISSING, "No mountpoint given");
    }
    return daemon_config;
}

void configureLogging(const DaemonConfig& config)
{
    Logger* logger = Logger::getInstance();
    logger->setLevel(config.log_level);
    logger->setPattern(config.log_pattern);
    if (!config.log_file.empty()) {
        logger->addFileSink(config.log_file, config.log_level);
    }
}

std::vector<std::string> buildFuseArgs(const char* program,
                                       const DaemonConfig& config,
                                       const CommandLine& command_line)
{
    std::vector<std::string> args = {program, config.mountpoint};
    if (config.foreground) {
        args.emplace_back("-f");
    }
    if (config.single_threaded) {
        args.emplace_back("-s");
    }
    if (command_line.debug) {
        args.emplace_back("-d");
    }

    std::string options = "ro,fsname=cgfs,subtype=cgfs";
    if (config.allow_other) {
        options += ",allow_other";
    }
    for (const auto& extra : command_line.mount_options) {
        options += "," + extra;
    }
    args.emplace_back("-o");
    args.push_back(options);
    return args;
}

} // namespace

int main(int argc, char* argv[])
{
    Logger* logger = Logger::getInstance();

    try {
        CommandLine command_line = parseCommandLine(argc, argv);
        if (command_line.help) {
            printUsage(argv[0]);
            return EXIT_SUCCESS;
        }

        DaemonConfig config = loadConfig(command_line);
        configureLogging(config);

        ProcSource source(config.proc_root);
        std::unique_ptr<ControlGroupClient> client =
            ControlGroupClient::createFilesystemClient(config.cgroup_root, config.proc_root);

        // Discovered once; the dispatcher treats it as immutable from here on
        std::vector<std::string> controllers = client->listControllers();
        std::string controller_names;
        for (const auto& name : controllers) {
            controller_names += controller_names.empty() ? name : "," + name;
        }
        logger->info("Serving controllers [{}] from {}", controller_names, config.cgroup_root);

        ProcRewriter rewriter(*client, source);
        CgroupTreeView tree(*client);
        FilesystemDispatcher dispatcher(std::move(controllers), rewriter, tree);

        logger->info("Mounting on {}", config.mountpoint);
        int status = runFilesystem(dispatcher, buildFuseArgs(argv[0], config, command_line));
        logger->info("Unmounted {} with status {}", config.mountpoint, status);
        logger->flush();
        return status;
    }
    catch (const FsError& e) {
        logger->critical("{}", e.what());
        if (e.getErrorCode() == ErrorCode::CONFIG_INVALID
            || e.getErrorCode() == ErrorCode::CONFIG_MISSING) {
            printUsage(argv[0]);
        }
    }
    catch (const std::exception& e) {
        logger->critical("Start-up failed: {}", e.what());
    }
    return EXIT_FAILURE;
}
