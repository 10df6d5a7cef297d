#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

#include <cgfs/core/error.hpp>
#include <cgfs/core/logger.hpp>
#include <cgfs/proc/cpu_list.hpp>
#include <cgfs/proc/proc_rewriter.hpp>

namespace cgfs {

namespace {

constexpr const char* CPUSET_CONTROLLER = "cpuset";
constexpr const char* MEMORY_CONTROLLER = "memory";
constexpr int MEMINFO_KEY_WIDTH = 15;
constexpr int MEMINFO_VALUE_WIDTH = 8;

std::string trim(const std::string& text)
{
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

bool isDigits(const std::string& text)
{
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

// Splits on '\n'; the flag records whether the text ended with one
std::vector<std::string> splitLines(const std::string& text, bool& trailing_newline)
{
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    trailing_newline = !text.empty() && text.back() == '\n';
    return lines;
}

uint64_t parseServiceNumber(const std::string& value, const std::string& what)
{
    std::string trimmed = trim(value);
    if (!isDigits(trimmed)) {
        throw FsError(ErrorCode::SERVICE_FAILURE, "Malformed " + what + ": '" + value + "'");
    }
    try {
        return std::stoull(trimmed);
    }
    catch (const std::out_of_range&) {
        throw FsError(ErrorCode::SERVICE_FAILURE, what + " out of range: '" + value + "'");
    }
}

struct MeminfoField {
    std::string key;
    uint64_t value;
    std::string unit;
};

std::vector<MeminfoField> parseMeminfo(const std::string& meminfo)
{
    std::vector<MeminfoField> fields;
    std::istringstream iss(meminfo);
    std::string line;
    while (std::getline(iss, line)) {
        if (trim(line).empty()) {
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            throw FsError(ErrorCode::SOURCE_UNAVAILABLE, "Malformed meminfo line: '" + line + "'");
        }

        MeminfoField field;
        field.key = line.substr(0, colon);

        std::istringstream rest(line.substr(colon + 1));
        std::string value;
        rest >> value >> field.unit;
        if (!isDigits(value)) {
            throw FsError(ErrorCode::SOURCE_UNAVAILABLE, "Malformed meminfo value: '" + line + "'");
        }
        try {
            field.value = std::stoull(value);
        }
        catch (const std::out_of_range&) {
            throw FsError(ErrorCode::SOURCE_UNAVAILABLE, "meminfo value out of range: '" + line + "'");
        }
        fields.push_back(std::move(field));
    }
    return fields;
}

} // namespace

std::string procFileName(ProcFile file)
{
    switch (file) {
        case ProcFile::CPUINFO:
            return "cpuinfo";
        case ProcFile::MEMINFO:
            return "meminfo";
        case ProcFile::STAT:
            return "stat";
        case ProcFile::UPTIME:
            return "uptime";
    }
    return "";
}

std::optional<ProcFile> procFileFromName(const std::string& name)
{
    for (ProcFile file : kProcFiles) {
        if (procFileName(file) == name) {
            return file;
        }
    }
    return std::nullopt;
}

std::unordered_map<std::string, uint64_t> parseMemoryStat(const std::string& content)
{
    std::unordered_map<std::string, uint64_t> values;
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        if (trim(line).empty()) {
            continue;
        }
        std::istringstream fields(line);
        std::string key;
        std::string value;
        std::string extra;
        if (!(fields >> key >> value) || (fields >> extra)) {
            throw FsError(ErrorCode::SERVICE_FAILURE, "Malformed memory.stat line: '" + line + "'");
        }
        values[key] = parseServiceNumber(value, "memory.stat value");
    }
    return values;
}

std::string rewriteCpuinfo(const std::string& cpuinfo, const std::vector<int>& cpus)
{
    // One record per blank-line separated block, indexed by its processor field
    std::vector<std::vector<std::string>> records;
    std::vector<int> record_cpus;

    std::vector<std::string> current;
    int current_cpu = -1;
    auto finish_record = [&]() {
        if (!current.empty()) {
            records.push_back(std::move(current));
            record_cpus.push_back(current_cpu);
        }
        current.clear();
        current_cpu = -1;
    };

    std::istringstream iss(cpuinfo);
    std::string line;
    while (std::getline(iss, line)) {
        if (trim(line).empty()) {
            finish_record();
            continue;
        }
        size_t colon = line.find(':');
        if (colon != std::string::npos && trim(line.substr(0, colon)) == "processor") {
            std::string value = trim(line.substr(colon + 1));
            if (isDigits(value) && value.size() < 10) {
                current_cpu = std::stoi(value);
            }
        }
        current.push_back(line);
    }
    finish_record();

    std::ostringstream out;
    int virtual_cpu = 0;
    for (int cpu : cpus) {
        auto it = std::find(record_cpus.begin(), record_cpus.end(), cpu);
        if (it == record_cpus.end()) {
            Logger::getInstance()->debug("cpuinfo has no record for cpu {}", cpu);
            continue;
        }

        if (virtual_cpu > 0) {
            out << "\n\n";
        }

        const auto& record = records[static_cast<size_t>(it - record_cpus.begin())];
        for (size_t i = 0; i < record.size(); ++i) {
            if (i > 0) {
                out << '\n';
            }
            const std::string& field = record[i];
            size_t colon = field.find(':');
            if (colon != std::string::npos && trim(field.substr(0, colon)) == "processor") {
                out << field.substr(0, colon + 1) << ' ' << virtual_cpu;
            }
            else {
                out << field;
            }
        }
        ++virtual_cpu;
    }
    out << '\n';

    return out.str();
}

std::string rewriteMeminfo(const std::string& meminfo, const MemoryCgroupStats& stats)
{
    std::vector<MeminfoField> fields = parseMeminfo(meminfo);

    auto find_field = [&fields](const std::string& key) -> MeminfoField* {
        for (auto& field : fields) {
            if (field.key == key) {
                return &field;
            }
        }
        return nullptr;
    };

    MeminfoField* mem_total = find_field("MemTotal");
    if (mem_total == nullptr) {
        throw FsError(ErrorCode::SOURCE_UNAVAILABLE, "meminfo has no MemTotal");
    }

    // Dependency order matters: MemFree uses the new MemTotal, MemAvailable the new MemFree
    mem_total->value = std::min(mem_total->value, stats.limit_in_bytes / 1024);

    uint64_t usage_kb = stats.usage_in_bytes / 1024;
    uint64_t mem_free = mem_total->value > usage_kb ? mem_total->value - usage_kb : 0;
    if (MeminfoField* field = find_field("MemFree")) {
        field->value = mem_free;
    }
    if (MeminfoField* field = find_field("MemAvailable")) {
        field->value = mem_free;
    }
    if (MeminfoField* field = find_field("Cached")) {
        field->value = stats.total_cache / 1024;
    }
    if (MeminfoField* field = find_field("Buffers")) {
        field->value = 0;
    }
    if (MeminfoField* field = find_field("SwapCached")) {
        field->value = 0;
    }

    std::ostringstream out;
    for (const auto& field : fields) {
        out << std::left << std::setw(MEMINFO_KEY_WIDTH) << (field.key + ":") << std::right
            << std::setw(MEMINFO_VALUE_WIDTH) << field.value;
        if (!field.unit.empty()) {
            out << ' ' << field.unit;
        }
        out << '\n';
    }
    return out.str();
}

std::string rewriteStat(const std::string& stat, const std::vector<int>& cpus)
{
    bool trailing_newline = false;
    std::vector<std::string> lines = splitLines(stat, trailing_newline);

    std::vector<std::string> kept;
    kept.reserve(lines.size());
    for (const auto& line : lines) {
        // Per-cpu lines are "cpu<N> ..."; the aggregate "cpu  ..." line passes through
        if (line.rfind("cpu", 0) != 0 || line.size() <= 3
            || !std::isdigit(static_cast<unsigned char>(line[3]))) {
            kept.push_back(line);
            continue;
        }

        size_t digits_end = line.find_first_not_of("0123456789", 3);
        std::string index = line.substr(3, digits_end == std::string::npos ? std::string::npos
                                                                           : digits_end - 3);
        if (index.size() >= 10) {
            continue;
        }

        int virtual_cpu = virtualCpuIndex(cpus, std::stoi(index));
        if (virtual_cpu < 0) {
            continue;
        }

        std::string rest = digits_end == std::string::npos ? "" : line.substr(digits_end);
        kept.push_back("cpu" + std::to_string(virtual_cpu) + rest);
    }

    std::string result;
    for (size_t i = 0; i < kept.size(); ++i) {
        result += kept[i];
        if (i + 1 < kept.size() || trailing_newline) {
            result += '\n';
        }
    }
    return result;
}

std::string rewriteUptime(const std::string& uptime, double elapsed_seconds)
{
    std::istringstream iss(uptime);
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }
    if (fields.empty()) {
        throw FsError(ErrorCode::SOURCE_UNAVAILABLE, "uptime source is empty");
    }

    std::ostringstream elapsed;
    elapsed << std::fixed << std::setprecision(2) << std::round(elapsed_seconds * 100.0) / 100.0;
    fields[0] = elapsed.str();

    std::string result;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            result += ' ';
        }
        result += fields[i];
    }
    result += '\n';
    return result;
}

ProcRewriter::ProcRewriter(const ControlGroupClient& client, const ProcSource& source, Clock clock)
    : client_(client), source_(source), clock_(std::move(clock))
{
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::string ProcRewriter::generate(ProcFile file, const CallerContext& caller) const
{
    Logger::getInstance()->debug("Generating /proc/{} for pid {}", procFileName(file), caller.pid);

    switch (file) {
        case ProcFile::CPUINFO:
            return cpuinfo(caller);
        case ProcFile::MEMINFO:
            return meminfo(caller);
        case ProcFile::STAT:
            return stat(caller);
        case ProcFile::UPTIME:
            return uptime(caller);
    }
    throw FsError(ErrorCode::NOT_FOUND, "Unknown proc file");
}

std::vector<int> ProcRewriter::callerCpus(const CallerContext& caller) const
{
    std::string cgroup = source_.cgroupPathFor(caller.pid, CPUSET_CONTROLLER);
    return expandCpuList(client_.getValue(CPUSET_CONTROLLER, cgroup, "cpuset.cpus"));
}

std::string ProcRewriter::cpuinfo(const CallerContext& caller) const
{
    std::vector<int> cpus = callerCpus(caller);
    return rewriteCpuinfo(source_.readFile("cpuinfo"), cpus);
}

std::string ProcRewriter::meminfo(const CallerContext& caller) const
{
    std::string cgroup = source_.cgroupPathFor(caller.pid, MEMORY_CONTROLLER);

    MemoryCgroupStats stats{};
    stats.limit_in_bytes = parseServiceNumber(
        client_.getValue(MEMORY_CONTROLLER, cgroup, "memory.limit_in_bytes"),
        "memory.limit_in_bytes");
    stats.usage_in_bytes = parseServiceNumber(
        client_.getValue(MEMORY_CONTROLLER, cgroup, "memory.usage_in_bytes"),
        "memory.usage_in_bytes");

    auto memory_stat = parseMemoryStat(client_.getValue(MEMORY_CONTROLLER, cgroup, "memory.stat"));
    auto cache = memory_stat.find("total_cache");
    if (cache == memory_stat.end()) {
        throw FsError(ErrorCode::SERVICE_FAILURE, "memory.stat of " + cgroup + " has no total_cache");
    }
    stats.total_cache = cache->second;

    return rewriteMeminfo(source_.readFile("meminfo"), stats);
}

std::string ProcRewriter::stat(const CallerContext& caller) const
{
    std::vector<int> cpus = callerCpus(caller);
    return rewriteStat(source_.readFile("stat"), cpus);
}

std::string ProcRewriter::uptime(const CallerContext& caller) const
{
    std::string cgroup = source_.cgroupPathFor(caller.pid, CPUSET_CONTROLLER);
    std::vector<pid_t> tasks = client_.getTasks(CPUSET_CONTROLLER, cgroup);

    bool found = false;
    auto oldest = std::chrono::system_clock::time_point::max();
    for (pid_t task : tasks) {
        try {
            oldest = std::min(oldest, source_.processChangeTime(task));
            found = true;
        }
        catch (const FsError& e) {
            // The task may have exited after the listing
            Logger::getInstance()->trace("Skipping task {}: {}", task, e.what());
        }
    }
    if (!found) {
        throw FsError(ErrorCode::SOURCE_UNAVAILABLE,
                      "No live task in cpuset cgroup " + cgroup + " to derive uptime from");
    }

    double elapsed = std::chrono::duration<double>(clock_() - oldest).count();
    return rewriteUptime(source_.readFile("uptime"), std::max(elapsed, 0.0));
}

} // namespace cgfs
