#include <cgfs/cgroup/tree_view.hpp>
#include <cgfs/core/error.hpp>

namespace cgfs {

namespace {

constexpr mode_t CGROUP_DIR_MODE = 0755;

} // namespace

CgroupTreeView::CgroupTreeView(const ControlGroupClient& client) : client_(client) {}

std::vector<VirtualEntry> CgroupTreeView::listEntries(const std::string& controller,
                                                      const std::string& path) const
{
    std::vector<KeyInfo> keys = client_.listKeys(controller, path);
    std::vector<std::string> children = client_.listChildren(controller, path);

    std::vector<VirtualEntry> entries;
    entries.reserve(keys.size() + children.size() + 2);
    entries.push_back({".", EntryKind::DIRECTORY, CGROUP_DIR_MODE, 0, 0});
    entries.push_back({"..", EntryKind::DIRECTORY, CGROUP_DIR_MODE, 0, 0});

    for (const auto& key : keys) {
        entries.push_back({key.name, EntryKind::FILE, key.mode, key.uid, key.gid});
    }
    for (const auto& child : children) {
        entries.push_back({child, EntryKind::DIRECTORY, CGROUP_DIR_MODE, 0, 0});
    }

    return entries;
}

ResolvedEntry CgroupTreeView::resolveAttributes(const std::string& controller,
                                                const std::string& path,
                                                const std::string& name) const
{
    if (name.empty() || name == "." || name == "..") {
        throw FsError(ErrorCode::NOT_FOUND, "Invalid entry name '" + name + "'");
    }

    for (auto& entry : listEntries(controller, path)) {
        if (entry.name != name) {
            continue;
        }

        uint64_t size = 0;
        if (entry.kind == EntryKind::FILE && name != EVENT_CONTROL_KEY) {
            size = client_.getValue(controller, path, name).size() + 1;
        }
        return {std::move(entry), size};
    }

    throw FsError(ErrorCode::NOT_FOUND, "No entry " + name + " in " + controller + ":" + path);
}

std::string CgroupTreeView::readKey(const std::string& controller,
                                    const std::string& path,
                                    const std::string& name) const
{
    if (name == EVENT_CONTROL_KEY) {
        throw FsError(ErrorCode::NOT_FOUND, std::string(EVENT_CONTROL_KEY) + " is not readable");
    }
    return client_.getValue(controller, path, name) + "\n";
}

} // namespace cgfs
