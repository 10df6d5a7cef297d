#pragma once

#include <cstdint>
#include <string>
#include <sys/types.h>
#include <variant>
#include <vector>

#include <cgfs/cgroup/tree_view.hpp>
#include <cgfs/core/caller_context.hpp>
#include <cgfs/core/error.hpp>
#include <cgfs/proc/proc_rewriter.hpp>

namespace cgfs {

// POSIX-shaped metadata; mode includes the file type bits
struct FileAttributes {
    EntryKind kind;
    mode_t mode;
    nlink_t nlink;
    uint64_t size;
    uid_t uid;
    gid_t gid;
};

// Path namespaces. Every valid path classifies into exactly one of these.
struct RootDir {};
struct ProcDir {};
struct ProcEntry {
    ProcFile file;
};
struct CgroupDir {};
struct ControllerDir {
    std::string controller;
};
struct CgroupNode {
    std::string controller;
    std::string parent; // cgroup path holding the entry, "/" for the hierarchy root
    std::string name;
};

using PathTarget = std::variant<RootDir, ProcDir, ProcEntry, CgroupDir, ControllerDir, CgroupNode>;

/**
 * @brief Routes filesystem calls to ProcRewriter or CgroupTreeView
 *
 * The controller set is fixed at construction and never modified, so the
 * dispatcher can be shared by all worker threads without locking. Each call
 * regenerates or refetches its content; there are no open-file handles.
 */
class FilesystemDispatcher {
public:
    FilesystemDispatcher(std::vector<std::string> controllers,
                         const ProcRewriter& rewriter,
                         const CgroupTreeView& tree);

    /**
     * @brief Classify @p path; throws NOT_FOUND for paths outside every namespace
     */
    PathTarget classify(const std::string& path) const;

    FileAttributes getAttributes(const std::string& path, const CallerContext& caller) const;

    std::vector<std::string> listDirectory(const std::string& path,
                                           const CallerContext& caller) const;

    /**
     * @brief Bytes [offset, offset + size) of the freshly built content
     *
     * An offset at or past the end yields an empty string.
     */
    std::string read(const std::string& path,
                     const CallerContext& caller,
                     size_t size,
                     uint64_t offset) const;

    /**
     * @brief Validate an open request; only read-only opens of files succeed
     */
    void open(const std::string& path, const CallerContext& caller, int flags) const;

    const std::vector<std::string>& controllers() const
    {
        return controllers_;
    }

private:
    std::vector<std::string> controllers_;
    const ProcRewriter& rewriter_;
    const CgroupTreeView& tree_;

    bool hasController(const std::string& name) const;
};

/**
 * @brief Negative errno reported to the kernel for @p error
 *
 * NOT_FOUND, SERVICE_FAILURE and SOURCE_UNAVAILABLE all become -ENOENT.
 */
int errnoFor(const FsError& error);

} // namespace cgfs
