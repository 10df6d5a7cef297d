#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace cgfs {

// One tunable key of a cgroup, with ownership as reported by the service
struct KeyInfo {
    std::string name;
    uid_t uid;
    gid_t gid;
    mode_t mode;
};

/**
 * @brief Request/response client for the cgroup-management service
 *
 * Paths are relative to the controller's hierarchy root and start with '/'.
 * Every call is synchronous and independent; implementations must be safe to
 * call from several threads at once. Failures are reported by throwing
 * FsError with NOT_FOUND (unknown cgroup or key) or SERVICE_FAILURE.
 */
class ControlGroupClient {
public:
    /**
     * @brief Client answering from a mounted cgroup v1 hierarchy
     * @param cgroup_root Directory holding one mount per controller
     * @param proc_root Kernel /proc used for controller discovery
     */
    static std::unique_ptr<ControlGroupClient> createFilesystemClient(
        const std::filesystem::path& cgroup_root = "/sys/fs/cgroup",
        const std::filesystem::path& proc_root = "/proc");

    virtual ~ControlGroupClient() = default;

    virtual std::vector<std::string> listControllers() const = 0;

    virtual std::string getValue(const std::string& controller,
                                 const std::string& path,
                                 const std::string& key) const = 0;

    virtual std::vector<KeyInfo> listKeys(const std::string& controller,
                                          const std::string& path) const = 0;

    virtual std::vector<std::string> listChildren(const std::string& controller,
                                                  const std::string& path) const = 0;

    virtual std::vector<pid_t> getTasks(const std::string& controller,
                                        const std::string& path) const = 0;

protected:
    ControlGroupClient() = default;

private:
    ControlGroupClient(const ControlGroupClient&) = delete;
    ControlGroupClient& operator=(const ControlGroupClient&) = delete;
};

} // namespace cgfs
