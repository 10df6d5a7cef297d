#include <gtest/gtest.h>
#include <chrono>
#include <string>

#include <cgfs/core/error.hpp>
#include <cgfs/proc/proc_rewriter.hpp>

#include "support/fake_cgroup_client.hpp"
#include "support/temp_tree.hpp"

using namespace cgfs;

namespace {

const char* const CPUINFO_FOUR_CPUS =
    "processor\t: 0\nvendor_id\t: GenuineIntel\ncore id\t\t: 0\n\n"
    "processor\t: 1\nvendor_id\t: GenuineIntel\ncore id\t\t: 1\n\n"
    "processor\t: 2\nvendor_id\t: GenuineIntel\ncore id\t\t: 2\n\n"
    "processor\t: 3\nvendor_id\t: GenuineIntel\ncore id\t\t: 3\n\n";

const char* const STAT_FOUR_CPUS =
    "cpu  100 0 50 1000 0 0 0 0 0 0\n"
    "cpu0 25 0 10 250 0 0 0 0 0 0\n"
    "cpu1 25 0 20 250 0 0 0 0 0 0\n"
    "cpu2 25 0 10 250 0 0 0 0 0 0\n"
    "cpu3 25 0 10 250 0 0 0 0 0 0\n"
    "intr 12345\n"
    "ctxt 6789\n"
    "btime 1500000000\n";

const char* const MEMINFO =
    "MemTotal:        1000000 kB\n"
    "MemFree:          800000 kB\n"
    "MemAvailable:     850000 kB\n"
    "Buffers:           10000 kB\n"
    "Cached:           100000 kB\n"
    "SwapCached:         5000 kB\n"
    "HugePages_Total:       0\n";

std::string meminfoLine(const std::string& key, uint64_t value, const std::string& unit = "kB")
{
    std::string line = key + ":";
    if (line.size() < 15) {
        line.resize(15, ' ');
    }
    std::string number = std::to_string(value);
    line += std::string(number.size() < 8 ? 8 - number.size() : 0, ' ') + number;
    if (!unit.empty()) {
        line += " " + unit;
    }
    return line + "\n";
}

} // namespace

TEST(ProcFileTest, NamesRoundTrip)
{
    for (ProcFile file : kProcFiles) {
        EXPECT_EQ(procFileFromName(procFileName(file)), file);
    }
    EXPECT_FALSE(procFileFromName("loadavg").has_value());
}

TEST(RewriteCpuinfoTest, SelectsAndRenumbersCpusetRecords)
{
    std::string result = rewriteCpuinfo(CPUINFO_FOUR_CPUS, {1, 3});
    EXPECT_EQ(result,
              "processor\t: 0\nvendor_id\t: GenuineIntel\ncore id\t\t: 1\n\n"
              "processor\t: 1\nvendor_id\t: GenuineIntel\ncore id\t\t: 3\n");
}

TEST(RewriteCpuinfoTest, FollowsCpusetOrder)
{
    std::string result = rewriteCpuinfo(CPUINFO_FOUR_CPUS, {2, 0});
    EXPECT_EQ(result,
              "processor\t: 0\nvendor_id\t: GenuineIntel\ncore id\t\t: 2\n\n"
              "processor\t: 1\nvendor_id\t: GenuineIntel\ncore id\t\t: 0\n");
}

TEST(RewriteCpuinfoTest, CpuWithoutRecordIsSkipped)
{
    std::string result = rewriteCpuinfo(CPUINFO_FOUR_CPUS, {9, 3});
    EXPECT_EQ(result, "processor\t: 0\nvendor_id\t: GenuineIntel\ncore id\t\t: 3\n");
    EXPECT_EQ(rewriteCpuinfo(CPUINFO_FOUR_CPUS, {}), "\n");
}

TEST(RewriteMeminfoTest, ClampsToCgroupLimits)
{
    MemoryCgroupStats stats{500 * 1024, 200 * 1024, 300 * 1024};
    std::string result = rewriteMeminfo(MEMINFO, stats);

    std::string expected = meminfoLine("MemTotal", 500) + meminfoLine("MemFree", 300)
                           + meminfoLine("MemAvailable", 300) + meminfoLine("Buffers", 0)
                           + meminfoLine("Cached", 300) + meminfoLine("SwapCached", 0)
                           + meminfoLine("HugePages_Total", 0, "");
    EXPECT_EQ(result, expected);
}

TEST(RewriteMeminfoTest, UnlimitedCgroupKeepsHostTotal)
{
    MemoryCgroupStats stats{9223372036854771712ULL, 1000 * 1024, 0};
    std::string result = rewriteMeminfo(MEMINFO, stats);
    EXPECT_EQ(result.substr(0, result.find('\n') + 1), meminfoLine("MemTotal", 1000000));
    EXPECT_NE(result.find(meminfoLine("MemFree", 999000)), std::string::npos);
}

TEST(RewriteMeminfoTest, UsageAboveLimitGivesZeroFree)
{
    MemoryCgroupStats stats{100 * 1024, 200 * 1024, 0};
    std::string result = rewriteMeminfo(MEMINFO, stats);
    EXPECT_NE(result.find(meminfoLine("MemFree", 0)), std::string::npos);
}

TEST(RewriteMeminfoTest, MissingMemTotalIsSourceUnavailable)
{
    try {
        rewriteMeminfo("MemFree: 10 kB\n", {1024, 0, 0});
        FAIL() << "Expected FsError";
    }
    catch (const FsError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::SOURCE_UNAVAILABLE);
    }
}

TEST(RewriteStatTest, KeepsAndRenumbersCpusetLines)
{
    std::string result = rewriteStat(STAT_FOUR_CPUS, {3, 1});
    EXPECT_EQ(result,
              "cpu  100 0 50 1000 0 0 0 0 0 0\n"
              "cpu1 25 0 20 250 0 0 0 0 0 0\n"
              "cpu0 25 0 10 250 0 0 0 0 0 0\n"
              "intr 12345\n"
              "ctxt 6789\n"
              "btime 1500000000\n");
}

TEST(RewriteStatTest, NoTrailingNewlineIsPreserved)
{
    EXPECT_EQ(rewriteStat("cpu  1 2\ncpu7 1 2", {7}), "cpu  1 2\ncpu0 1 2");
}

TEST(RewriteUptimeTest, ReplacesFirstFieldOnly)
{
    EXPECT_EQ(rewriteUptime("350735.47 234388.90\n", 12.5), "12.50 234388.90\n");
    EXPECT_EQ(rewriteUptime("1.00 2.00\n", 3.14159), "3.14 2.00\n");
    EXPECT_THROW(rewriteUptime("  \n", 1.0), FsError);
}

TEST(ParseMemoryStatTest, ParsesPairs)
{
    auto values = parseMemoryStat("cache 4096\nrss 8192\ntotal_cache 12288\n");
    EXPECT_EQ(values.at("cache"), 4096u);
    EXPECT_EQ(values.at("total_cache"), 12288u);
    EXPECT_THROW(parseMemoryStat("cache\n"), FsError);
    EXPECT_THROW(parseMemoryStat("cache 1 2\n"), FsError);
    EXPECT_THROW(parseMemoryStat("cache x\n"), FsError);
}

class ProcRewriterTest : public ::testing::Test {
protected:
    ProcRewriterTest()
        : proc_("rewriter"), source_(proc_.root()),
          rewriter_(client_, source_, [this]() { return now_; })
    {
        client_.addController("cpuset");
        client_.addController("memory");

        proc_.write("cpuinfo", CPUINFO_FOUR_CPUS);
        proc_.write("stat", STAT_FOUR_CPUS);
        proc_.write("meminfo", MEMINFO);
        proc_.write("uptime", "350735.47 234388.90\n");
        proc_.write("100/cgroup", "6:cpuset:/web\n5:memory:/web\n");

        client_.setValue("cpuset", "/web", "cpuset.cpus", "1,3");
        client_.setValue("memory", "/web", "memory.limit_in_bytes", "512000");
        client_.setValue("memory", "/web", "memory.usage_in_bytes", "204800");
        client_.setValue("memory", "/web", "memory.stat", "cache 1024\ntotal_cache 307200\n");
        client_.node("cpuset", "/web").tasks = {100, 200};
    }

    cgfs_test::TempTree proc_;
    cgfs_test::FakeCgroupClient client_;
    ProcSource source_;
    std::chrono::system_clock::time_point now_;
    ProcRewriter rewriter_;
    CallerContext caller_{1000, 1000, 100};
};

TEST_F(ProcRewriterTest, CpuinfoFollowsCallerCpuset)
{
    std::string result = rewriter_.generate(ProcFile::CPUINFO, caller_);
    EXPECT_EQ(result, rewriteCpuinfo(CPUINFO_FOUR_CPUS, {1, 3}));
}

TEST_F(ProcRewriterTest, StatFollowsCallerCpuset)
{
    std::string result = rewriter_.generate(ProcFile::STAT, caller_);
    EXPECT_NE(result.find("cpu0 25 0 20"), std::string::npos);
    EXPECT_NE(result.find("cpu1 25 0 10"), std::string::npos);
    EXPECT_EQ(result.find("cpu2"), std::string::npos);
}

TEST_F(ProcRewriterTest, MeminfoUsesMemoryCgroup)
{
    std::string result = rewriter_.generate(ProcFile::MEMINFO, caller_);
    EXPECT_NE(result.find(meminfoLine("MemTotal", 500)), std::string::npos);
    EXPECT_NE(result.find(meminfoLine("MemFree", 300)), std::string::npos);
    EXPECT_NE(result.find(meminfoLine("Cached", 300)), std::string::npos);
}

TEST_F(ProcRewriterTest, MeminfoWithoutTotalCacheFails)
{
    client_.setValue("memory", "/web", "memory.stat", "cache 1024\n");
    try {
        rewriter_.generate(ProcFile::MEMINFO, caller_);
        FAIL() << "Expected FsError";
    }
    catch (const FsError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::SERVICE_FAILURE);
    }
}

TEST_F(ProcRewriterTest, UptimeMeasuresFromOldestLiveTask)
{
    // Task 200 has no /proc entry and is skipped
    proc_.mkdir("100");
    now_ = source_.processChangeTime(100) + std::chrono::milliseconds(90250);

    EXPECT_EQ(rewriter_.generate(ProcFile::UPTIME, caller_), "90.25 234388.90\n");
}

TEST_F(ProcRewriterTest, UptimeIsNeverNegative)
{
    proc_.mkdir("100");
    now_ = source_.processChangeTime(100) - std::chrono::seconds(5);

    EXPECT_EQ(rewriter_.generate(ProcFile::UPTIME, caller_), "0.00 234388.90\n");
}

TEST_F(ProcRewriterTest, UptimeWithoutLiveTasksFails)
{
    client_.node("cpuset", "/web").tasks = {300};
    try {
        rewriter_.generate(ProcFile::UPTIME, caller_);
        FAIL() << "Expected FsError";
    }
    catch (const FsError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::SOURCE_UNAVAILABLE);
    }
}

TEST_F(ProcRewriterTest, ServiceFailurePropagates)
{
    client_.failOn("cpuset", "/web", "cpuset.cpus");
    EXPECT_THROW(rewriter_.generate(ProcFile::CPUINFO, caller_), FsError);
}

TEST_F(ProcRewriterTest, MalformedCpusetFails)
{
    client_.setValue("cpuset", "/web", "cpuset.cpus", "1-");
    try {
        rewriter_.generate(ProcFile::STAT, caller_);
        FAIL() << "Expected FsError";
    }
    catch (const FsError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::SERVICE_FAILURE);
    }
}

TEST_F(ProcRewriterTest, UnknownCallerIsReported)
{
    CallerContext stranger{0, 0, 4242};
    EXPECT_THROW(rewriter_.generate(ProcFile::CPUINFO, stranger), FsError);
}
