#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <cgfs/core/error.hpp>
#include <cgfs/proc/proc_source.hpp>

namespace cgfs {

bool parseProcCgroupLine(const std::string& line, ProcCgroupEntry& entry)
{
    // The path itself may contain ':' so only the first two separators count
    size_t first = line.find(':');
    if (first == std::string::npos) {
        return false;
    }
    size_t second = line.find(':', first + 1);
    if (second == std::string::npos) {
        return false;
    }

    std::string id = line.substr(0, first);
    if (id.empty() || id.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }

    try {
        entry.hierarchy_id = std::stoi(id);
    }
    catch (const std::out_of_range&) {
        return false;
    }
    entry.controllers.clear();

    std::istringstream names(line.substr(first + 1, second - first - 1));
    std::string name;
    while (std::getline(names, name, ',')) {
        if (!name.empty()) {
            entry.controllers.push_back(name);
        }
    }

    entry.path = line.substr(second + 1);
    if (!entry.path.empty() && entry.path.back() == '\n') {
        entry.path.pop_back();
    }
    return true;
}

ProcSource::ProcSource(std::filesystem::path root) : root_(std::move(root)) {}

std::string ProcSource::readFile(const std::string& relative_path) const
{
    std::filesystem::path file_path = root_ / relative_path;
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw FsError(ErrorCode::SOURCE_UNAVAILABLE,
                      "Failed to open " + file_path.string() + ": " + std::strerror(errno));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw FsError(ErrorCode::SOURCE_UNAVAILABLE, "Failed to read " + file_path.string());
    }
    return buffer.str();
}

std::vector<ProcCgroupEntry> ProcSource::readProcessCgroups(pid_t pid) const
{
    std::istringstream content(readFile(std::to_string(pid) + "/cgroup"));

    std::vector<ProcCgroupEntry> entries;
    std::string line;
    while (std::getline(content, line)) {
        ProcCgroupEntry entry;
        if (parseProcCgroupLine(line, entry)) {
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

std::string ProcSource::cgroupPathFor(pid_t pid, const std::string& controller) const
{
    for (const auto& entry : readProcessCgroups(pid)) {
        for (const auto& name : entry.controllers) {
            if (name == controller) {
                return entry.path;
            }
        }
    }
    throw FsError(ErrorCode::NOT_FOUND,
                  "Process " + std::to_string(pid) + " has no " + controller + " cgroup");
}

std::chrono::system_clock::time_point ProcSource::processChangeTime(pid_t pid) const
{
    std::filesystem::path dir = root_ / std::to_string(pid);
    struct stat st {};
    if (::stat(dir.c_str(), &st) != 0) {
        throw FsError(ErrorCode::SOURCE_UNAVAILABLE,
                      "Failed to stat " + dir.string() + ": " + std::strerror(errno));
    }

    auto since_epoch = std::chrono::seconds(st.st_ctim.tv_sec)
                       + std::chrono::nanoseconds(st.st_ctim.tv_nsec);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

} // namespace cgfs
