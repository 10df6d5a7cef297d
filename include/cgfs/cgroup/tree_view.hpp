#pragma once

#include <cstdint>
#include <string>
#include <sys/types.h>
#include <vector>

#include <cgfs/cgroup/cgroup_client.hpp>

namespace cgfs {

enum class EntryKind {
    FILE,
    DIRECTORY
};

// Directory entry synthesized for one listing or attribute call
struct VirtualEntry {
    std::string name;
    EntryKind kind;
    mode_t mode;
    uid_t uid;
    gid_t gid;
};

struct ResolvedEntry {
    VirtualEntry entry;
    uint64_t size;
};

/**
 * @brief Read-only projection of a controller's cgroup hierarchy
 *
 * One directory per cgroup and one file per key. Ownership and permissions of
 * key files are passed through from the service without validation.
 */
class CgroupTreeView {
public:
    // Listed but never read: its size is reported as 0
    static constexpr const char* EVENT_CONTROL_KEY = "cgroup.event_control";

    explicit CgroupTreeView(const ControlGroupClient& client);

    /**
     * @brief "." and ".." followed by one file per key and one directory per child
     */
    std::vector<VirtualEntry> listEntries(const std::string& controller,
                                          const std::string& path) const;

    /**
     * @brief Look up @p name inside @p path; throws NOT_FOUND when absent
     */
    ResolvedEntry resolveAttributes(const std::string& controller,
                                    const std::string& path,
                                    const std::string& name) const;

    std::string readKey(const std::string& controller,
                        const std::string& path,
                        const std::string& name) const;

private:
    const ControlGroupClient& client_;
};

} // namespace cgfs
