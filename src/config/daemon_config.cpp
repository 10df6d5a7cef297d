#include <cgfs/config/daemon_config.hpp>

namespace cgfs {

const ConfigSchema& DaemonConfig::schema()
{
    static const ConfigSchema schema = {
        {"mountpoint", ConfigValueType::STRING},
        {"proc_root", ConfigValueType::STRING},
        {"cgroup_root", ConfigValueType::STRING},
        {"log.level", ConfigValueType::STRING},
        {"log.file", ConfigValueType::STRING},
        {"log.pattern", ConfigValueType::STRING},
        {"fuse.foreground", ConfigValueType::BOOLEAN},
        {"fuse.single_threaded", ConfigValueType::BOOLEAN},
        {"fuse.allow_other", ConfigValueType::BOOLEAN},
    };
    return schema;
}

DaemonConfig DaemonConfig::fromConfig(const ConfigManager& config)
{
    ConfigManager expanded = config.expandEnvironmentVariables();
    expanded.validate(schema());

    DaemonConfig result;
    result.mountpoint = expanded.get<std::string>("mountpoint", result.mountpoint);
    result.proc_root = expanded.get<std::string>("proc_root", result.proc_root);
    result.cgroup_root = expanded.get<std::string>("cgroup_root", result.cgroup_root);

    result.log_level = fromString(expanded.get<std::string>("log.level", toString(result.log_level)));
    result.log_file = expanded.get<std::string>("log.file", result.log_file);
    result.log_pattern = expanded.get<std::string>("log.pattern", result.log_pattern);

    result.foreground = expanded.get<bool>("fuse.foreground", result.foreground);
    result.single_threaded = expanded.get<bool>("fuse.single_threaded", result.single_threaded);
    result.allow_other = expanded.get<bool>("fuse.allow_other", result.allow_other);

    if (result.proc_root.empty() || result.cgroup_root.empty()) {
        throw FsError(ErrorCode::CONFIG_INVALID, "proc_root and cgroup_root must not be empty");
    }

    return result;
}

} // namespace cgfs
