#include <algorithm>
#include <cctype>
#include <sstream>

#include <cgfs/core/error.hpp>
#include <cgfs/proc/cpu_list.hpp>

namespace cgfs {

namespace {

std::string trim(const std::string& text)
{
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

int parseCpu(const std::string& token, const std::string& list)
{
    if (token.empty() || token.size() > 9
        || !std::all_of(token.begin(), token.end(),
                        [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw FsError(ErrorCode::SERVICE_FAILURE, "Malformed cpu list: '" + list + "'");
    }
    return std::stoi(token);
}

} // namespace

std::vector<int> expandCpuList(const std::string& list)
{
    std::vector<int> cpus;
    std::string trimmed = trim(list);
    if (trimmed.empty()) {
        return cpus;
    }

    std::istringstream iss(trimmed);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        size_t dash = item.find('-');
        if (dash == std::string::npos) {
            cpus.push_back(parseCpu(item, list));
            continue;
        }

        int first = parseCpu(trim(item.substr(0, dash)), list);
        int last = parseCpu(trim(item.substr(dash + 1)), list);
        if (first > last) {
            throw FsError(ErrorCode::SERVICE_FAILURE, "Descending cpu range in '" + list + "'");
        }
        for (int cpu = first; cpu <= last; ++cpu) {
            cpus.push_back(cpu);
        }
    }

    // A trailing comma leaves getline without a final empty item
    if (trimmed.back() == ',') {
        throw FsError(ErrorCode::SERVICE_FAILURE, "Malformed cpu list: '" + list + "'");
    }

    return cpus;
}

int virtualCpuIndex(const std::vector<int>& cpus, int cpu)
{
    auto it = std::find(cpus.begin(), cpus.end(), cpu);
    if (it == cpus.end()) {
        return -1;
    }
    return static_cast<int>(it - cpus.begin());
}

} // namespace cgfs
