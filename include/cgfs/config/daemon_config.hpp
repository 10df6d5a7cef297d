#pragma once

#include <cgfs/config/config_manager.hpp>
#include <cgfs/core/logger.hpp>
#include <string>

namespace cgfs {

/**
 * @brief Settings the cgfsd daemon reads at start-up
 */
struct DaemonConfig {
    std::string mountpoint;
    std::string proc_root = "/proc";
    std::string cgroup_root = "/sys/fs/cgroup";

    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    std::string log_pattern = "%t [%l] %n: %v";

    bool foreground = false;
    bool single_threaded = false;
    bool allow_other = true;

    /**
     * @brief Build from a loaded configuration, falling back to defaults
     *
     * Environment variables are expanded first. Throws CONFIG_INVALID when a
     * key is present with the wrong type.
     */
    static DaemonConfig fromConfig(const ConfigManager& config);

    static const ConfigSchema& schema();
};

} // namespace cgfs
