#include <fcntl.h>
#include <sys/stat.h>
#include <algorithm>
#include <cerrno>
#include <sstream>

#include <cgfs/fs/dispatcher.hpp>

namespace cgfs {

namespace {

constexpr mode_t DIRECTORY_MODE = 0755;
constexpr mode_t PROC_FILE_MODE = 0444;

constexpr const char* PROC_DIR_NAME = "proc";
constexpr const char* CGROUP_DIR_NAME = "cgroup";

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

FileAttributes directoryAttributes()
{
    return {EntryKind::DIRECTORY, S_IFDIR | DIRECTORY_MODE, 2, 0, 0, 0};
}

std::vector<std::string> splitPath(const std::string& path)
{
    if (path.empty() || path.front() != '/') {
        throw FsError(ErrorCode::NOT_FOUND, "Path must be absolute: '" + path + "'");
    }

    std::vector<std::string> segments;
    std::istringstream iss(path);
    std::string segment;
    while (std::getline(iss, segment, '/')) {
        if (segment.empty()) {
            continue;
        }
        if (segment == "." || segment == "..") {
            throw FsError(ErrorCode::NOT_FOUND, "Relative segment in '" + path + "'");
        }
        segments.push_back(segment);
    }
    return segments;
}

std::string joinCgroupPath(const CgroupNode& node)
{
    if (node.parent == "/") {
        return "/" + node.name;
    }
    return node.parent + "/" + node.name;
}

} // namespace

FilesystemDispatcher::FilesystemDispatcher(std::vector<std::string> controllers,
                                           const ProcRewriter& rewriter,
                                           const CgroupTreeView& tree)
    : controllers_(std::move(controllers)), rewriter_(rewriter), tree_(tree)
{}

bool FilesystemDispatcher::hasController(const std::string& name) const
{
    return std::find(controllers_.begin(), controllers_.end(), name) != controllers_.end();
}

PathTarget FilesystemDispatcher::classify(const std::string& path) const
{
    std::vector<std::string> segments = splitPath(path);

    if (segments.empty()) {
        return RootDir{};
    }

    if (segments[0] == PROC_DIR_NAME) {
        if (segments.size() == 1) {
            return ProcDir{};
        }
        if (segments.size() == 2) {
            if (auto file = procFileFromName(segments[1])) {
                return ProcEntry{*file};
            }
        }
    }
    else if (segments[0] == CGROUP_DIR_NAME) {
        if (segments.size() == 1) {
            return CgroupDir{};
        }
        if (hasController(segments[1])) {
            if (segments.size() == 2) {
                return ControllerDir{segments[1]};
            }

            CgroupNode node{segments[1], "", segments.back()};
            for (size_t i = 2; i + 1 < segments.size(); ++i) {
                node.parent += "/" + segments[i];
            }
            if (node.parent.empty()) {
                node.parent = "/";
            }
            return node;
        }
    }

    throw FsError(ErrorCode::NOT_FOUND, "No such path: " + path);
}

FileAttributes FilesystemDispatcher::getAttributes(const std::string& path,
                                                   const CallerContext& caller) const
{
    return std::visit(
        Overloaded{
            [&](const ProcEntry& entry) -> FileAttributes {
                std::string content = rewriter_.generate(entry.file, caller);
                return {EntryKind::FILE, S_IFREG | PROC_FILE_MODE, 1, content.size(), 0, 0};
            },
            [&](const CgroupNode& node) -> FileAttributes {
                ResolvedEntry resolved = tree_.resolveAttributes(node.controller, node.parent,
                                                                 node.name);
                if (resolved.entry.kind == EntryKind::DIRECTORY) {
                    return {EntryKind::DIRECTORY, S_IFDIR | resolved.entry.mode, 2, 0,
                            resolved.entry.uid, resolved.entry.gid};
                }
                return {EntryKind::FILE, S_IFREG | resolved.entry.mode, 1, resolved.size,
                        resolved.entry.uid, resolved.entry.gid};
            },
            [](const auto&) -> FileAttributes { return directoryAttributes(); },
        },
        classify(path));
}

std::vector<std::string> FilesystemDispatcher::listDirectory(const std::string& path,
                                                             const CallerContext&) const
{
    return std::visit(
        Overloaded{
            [](const RootDir&) -> std::vector<std::string> {
                return {".", "..", PROC_DIR_NAME, CGROUP_DIR_NAME};
            },
            [](const ProcDir&) -> std::vector<std::string> {
                std::vector<std::string> names = {".", ".."};
                for (ProcFile file : kProcFiles) {
                    names.push_back(procFileName(file));
                }
                return names;
            },
            [&](const ProcEntry&) -> std::vector<std::string> {
                throw FsError(ErrorCode::NOT_A_DIRECTORY, path);
            },
            [&](const CgroupDir&) -> std::vector<std::string> {
                std::vector<std::string> names = {".", ".."};
                names.insert(names.end(), controllers_.begin(), controllers_.end());
                return names;
            },
            [&](const ControllerDir& dir) -> std::vector<std::string> {
                std::vector<std::string> names;
                for (const auto& entry : tree_.listEntries(dir.controller, "/")) {
                    names.push_back(entry.name);
                }
                return names;
            },
            [&](const CgroupNode& node) -> std::vector<std::string> {
                std::vector<std::string> names;
                for (const auto& entry : tree_.listEntries(node.controller, joinCgroupPath(node))) {
                    names.push_back(entry.name);
                }
                return names;
            },
        },
        classify(path));
}

std::string FilesystemDispatcher::read(const std::string& path,
                                       const CallerContext& caller,
                                       size_t size,
                                       uint64_t offset) const
{
    std::string content = std::visit(
        Overloaded{
            [&](const ProcEntry& entry) -> std::string {
                return rewriter_.generate(entry.file, caller);
            },
            [&](const CgroupNode& node) -> std::string {
                return tree_.readKey(node.controller, node.parent, node.name);
            },
            [&](const auto&) -> std::string { throw FsError(ErrorCode::IS_DIRECTORY, path); },
        },
        classify(path));

    if (offset >= content.size()) {
        return "";
    }
    return content.substr(static_cast<size_t>(offset), size);
}

void FilesystemDispatcher::open(const std::string& path,
                                const CallerContext& caller,
                                int flags) const
{
    if ((flags & O_ACCMODE) != O_RDONLY || (flags & O_TRUNC) != 0) {
        throw FsError(ErrorCode::READ_ONLY, path);
    }

    PathTarget target = classify(path);
    if (std::holds_alternative<ProcEntry>(target)) {
        return;
    }
    if (!std::holds_alternative<CgroupNode>(target)) {
        throw FsError(ErrorCode::IS_DIRECTORY, path);
    }

    if (getAttributes(path, caller).kind == EntryKind::DIRECTORY) {
        throw FsError(ErrorCode::IS_DIRECTORY, path);
    }
}

int errnoFor(const FsError& error)
{
    switch (error.getErrorCode()) {
        case ErrorCode::NOT_FOUND:
        case ErrorCode::SERVICE_FAILURE:
        case ErrorCode::SOURCE_UNAVAILABLE:
            return -ENOENT;
        case ErrorCode::READ_ONLY:
            return -EACCES;
        case ErrorCode::IS_DIRECTORY:
            return -EISDIR;
        case ErrorCode::NOT_A_DIRECTORY:
            return -ENOTDIR;
        default:
            return -EIO;
    }
}

} // namespace cgfs
