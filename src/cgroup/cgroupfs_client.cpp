#include <sys/stat.h>
#include <sys/types.h>
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

#include <cgfs/cgroup/cgroup_client.hpp>
#include <cgfs/core/error.hpp>
#include <cgfs/core/logger.hpp>

namespace cgfs {

namespace {

std::vector<std::string> splitString(const std::string& text, char delimiter)
{
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(text);
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

} // namespace

// Answers the service contract from cgroup v1 mounts laid out as
// <cgroup_root>/<controller>/<path>/<key>
class CgroupFsClient : public ControlGroupClient {
public:
    CgroupFsClient(std::filesystem::path cgroup_root, std::filesystem::path proc_root)
        : cgroup_root_(std::move(cgroup_root)), proc_root_(std::move(proc_root))
    {}

    std::vector<std::string> listControllers() const override
    {
        std::filesystem::path self_cgroup = proc_root_ / "self" / "cgroup";
        std::ifstream file(self_cgroup);
        if (!file) {
            throw FsError(ErrorCode::SERVICE_FAILURE,
                          "Failed to open " + self_cgroup.string());
        }

        std::vector<std::string> controllers;
        std::string line;
        while (std::getline(file, line)) {
            // hierarchy-id:subsystem[,subsystem...]:path
            auto fields = splitString(line, ':');
            if (fields.size() < 3) {
                continue;
            }
            for (const auto& name : splitString(fields[1], ',')) {
                if (name.empty() || name.rfind("name=", 0) == 0) {
                    continue;
                }
                if (std::find(controllers.begin(), controllers.end(), name) != controllers.end()) {
                    continue;
                }
                std::error_code ec;
                if (std::filesystem::is_directory(cgroup_root_ / name, ec)) {
                    controllers.push_back(name);
                }
                else {
                    Logger::getInstance()->debug("Controller {} has no mount under {}", name,
                                                 cgroup_root_.string());
                }
            }
        }

        return controllers;
    }

    std::string getValue(const std::string& controller,
                         const std::string& path,
                         const std::string& key) const override
    {
        std::filesystem::path file_path = resolveKey(controller, path, key);
        std::ifstream file(file_path, std::ios::binary);
        if (!file) {
            throw errorFor(errno, "Failed to open " + file_path.string());
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            throw FsError(ErrorCode::SERVICE_FAILURE, "Failed to read " + file_path.string());
        }

        std::string content = buffer.str();
        if (!content.empty() && content.back() == '\n') {
            content.pop_back();
        }
        return content;
    }

    std::vector<KeyInfo> listKeys(const std::string& controller,
                                  const std::string& path) const override
    {
        std::filesystem::path dir = resolveDirectory(controller, path);

        std::vector<KeyInfo> keys;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
             it.increment(ec)) {
            struct stat st {};
            if (::lstat(it->path().c_str(), &st) != 0) {
                // Entry removed while listing
                continue;
            }
            if (!S_ISREG(st.st_mode)) {
                continue;
            }
            keys.push_back({it->path().filename().string(), st.st_uid, st.st_gid,
                            static_cast<mode_t>(st.st_mode & 07777)});
        }
        if (ec) {
            throw FsError(ErrorCode::SERVICE_FAILURE,
                          "Failed to list keys of " + dir.string() + ": " + ec.message());
        }

        std::sort(keys.begin(), keys.end(),
                  [](const KeyInfo& a, const KeyInfo& b) { return a.name < b.name; });
        return keys;
    }

    std::vector<std::string> listChildren(const std::string& controller,
                                          const std::string& path) const override
    {
        std::filesystem::path dir = resolveDirectory(controller, path);

        std::vector<std::string> children;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
             it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
                children.push_back(it->path().filename().string());
            }
        }
        if (ec) {
            throw FsError(ErrorCode::SERVICE_FAILURE,
                          "Failed to list children of " + dir.string() + ": " + ec.message());
        }

        std::sort(children.begin(), children.end());
        return children;
    }

    std::vector<pid_t> getTasks(const std::string& controller,
                                const std::string& path) const override
    {
        std::string content = getValue(controller, path, "tasks");

        std::vector<pid_t> tasks;
        std::istringstream iss(content);
        std::string line;
        while (std::getline(iss, line)) {
            if (line.empty()) {
                continue;
            }
            size_t consumed = 0;
            long pid = 0;
            try {
                pid = std::stol(line, &consumed);
            }
            catch (const std::exception&) {
                consumed = 0;
            }
            if (consumed != line.size() || pid <= 0) {
                throw FsError(ErrorCode::SERVICE_FAILURE,
                              "Malformed task id '" + line + "' in " + controller + ":" + path);
            }
            tasks.push_back(static_cast<pid_t>(pid));
        }
        return tasks;
    }

private:
    std::filesystem::path cgroup_root_;
    std::filesystem::path proc_root_;

    std::filesystem::path buildPath(const std::string& controller, const std::string& path) const
    {
        if (controller.empty() || controller.find('/') != std::string::npos || controller == "."
            || controller == "..") {
            throw FsError(ErrorCode::NOT_FOUND, "Invalid controller name: " + controller);
        }

        std::filesystem::path result = cgroup_root_ / controller;
        for (const auto& segment : splitString(path, '/')) {
            if (segment.empty() || segment == ".") {
                continue;
            }
            if (segment == "..") {
                throw FsError(ErrorCode::NOT_FOUND, "Parent references are not allowed: " + path);
            }
            result /= segment;
        }
        return result;
    }

    std::filesystem::path resolveDirectory(const std::string& controller,
                                           const std::string& path) const
    {
        std::filesystem::path dir = buildPath(controller, path);
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            throw FsError(ErrorCode::NOT_FOUND, "No such cgroup: " + controller + ":" + path);
        }
        return dir;
    }

    std::filesystem::path resolveKey(const std::string& controller,
                                     const std::string& path,
                                     const std::string& key) const
    {
        if (key.empty() || key.find('/') != std::string::npos || key == "." || key == "..") {
            throw FsError(ErrorCode::NOT_FOUND, "Invalid key name: " + key);
        }
        std::filesystem::path file_path = resolveDirectory(controller, path) / key;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file_path, ec)) {
            throw FsError(ErrorCode::NOT_FOUND,
                          "No key " + key + " in " + controller + ":" + path);
        }
        return file_path;
    }

    static FsError errorFor(int err, const std::string& message)
    {
        if (err == ENOENT || err == ENOTDIR) {
            return FsError(ErrorCode::NOT_FOUND, message);
        }
        return makeSystemError(ErrorCode::SERVICE_FAILURE,
                               std::system_error(err, std::generic_category(), message));
    }
};

std::unique_ptr<ControlGroupClient> ControlGroupClient::createFilesystemClient(
    const std::filesystem::path& cgroup_root, const std::filesystem::path& proc_root)
{
    return std::make_unique<CgroupFsClient>(cgroup_root, proc_root);
}

} // namespace cgfs
