#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <cgfs/cgroup/cgroup_client.hpp>
#include <cgfs/core/caller_context.hpp>
#include <cgfs/proc/proc_source.hpp>

namespace cgfs {

// The synthetic files served under /proc
enum class ProcFile {
    CPUINFO,
    MEMINFO,
    STAT,
    UPTIME
};

inline constexpr std::array<ProcFile, 4> kProcFiles = {ProcFile::CPUINFO, ProcFile::MEMINFO,
                                                       ProcFile::STAT, ProcFile::UPTIME};

std::string procFileName(ProcFile file);
std::optional<ProcFile> procFileFromName(const std::string& name);

// Memory cgroup figures feeding the meminfo rewrite, all in bytes
struct MemoryCgroupStats {
    uint64_t limit_in_bytes;
    uint64_t usage_in_bytes;
    uint64_t total_cache;
};

/**
 * @brief Parse memory.stat into key/value pairs
 *
 * Throws FsError(SERVICE_FAILURE) on a line that is not "key value".
 */
std::unordered_map<std::string, uint64_t> parseMemoryStat(const std::string& content);

// Content transforms. Each takes the real kernel text plus the caller's
// cgroup facts and returns the text the caller sees.

std::string rewriteCpuinfo(const std::string& cpuinfo, const std::vector<int>& cpus);
std::string rewriteMeminfo(const std::string& meminfo, const MemoryCgroupStats& stats);
std::string rewriteStat(const std::string& stat, const std::vector<int>& cpus);
std::string rewriteUptime(const std::string& uptime, double elapsed_seconds);

/**
 * @brief Regenerates the virtualized /proc files for one caller
 *
 * Holds only references to collaborators that are themselves stateless, so a
 * single instance serves every worker thread. Nothing is cached: each call
 * re-reads the kernel source and re-queries the cgroup service. Failures
 * throw FsError and no partial content is returned.
 */
class ProcRewriter {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    ProcRewriter(const ControlGroupClient& client, const ProcSource& source, Clock clock = {});

    std::string generate(ProcFile file, const CallerContext& caller) const;

    std::string cpuinfo(const CallerContext& caller) const;
    std::string meminfo(const CallerContext& caller) const;
    std::string stat(const CallerContext& caller) const;
    std::string uptime(const CallerContext& caller) const;

private:
    const ControlGroupClient& client_;
    const ProcSource& source_;
    Clock clock_;

    std::vector<int> callerCpus(const CallerContext& caller) const;
};

} // namespace cgfs
