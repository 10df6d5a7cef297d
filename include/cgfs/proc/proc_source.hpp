#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <sys/types.h>
#include <vector>

namespace cgfs {

// One line of /proc/<pid>/cgroup
struct ProcCgroupEntry {
    int hierarchy_id;
    std::vector<std::string> controllers;
    std::string path;
};

/**
 * @brief Read-only access to the real kernel /proc
 *
 * The root is configurable so tests can point it at a fixture tree. Missing
 * or unreadable sources are reported as SOURCE_UNAVAILABLE.
 */
class ProcSource {
public:
    explicit ProcSource(std::filesystem::path root = "/proc");

    /**
     * @brief Whole content of a file below the root, e.g. "meminfo"
     */
    std::string readFile(const std::string& relative_path) const;

    std::vector<ProcCgroupEntry> readProcessCgroups(pid_t pid) const;

    /**
     * @brief Cgroup path of @p pid in the hierarchy that carries @p controller
     */
    std::string cgroupPathFor(pid_t pid, const std::string& controller) const;

    /**
     * @brief Metadata change time of /proc/<pid>, used as a start-time proxy
     */
    std::chrono::system_clock::time_point processChangeTime(pid_t pid) const;

    const std::filesystem::path& root() const
    {
        return root_;
    }

private:
    std::filesystem::path root_;
};

/**
 * @brief Parse one "hierarchy-id:controllers:path" line
 * @return false when the line does not have three fields or a numeric id
 */
bool parseProcCgroupLine(const std::string& line, ProcCgroupEntry& entry);

} // namespace cgfs
