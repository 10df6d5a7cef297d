#include <gtest/gtest.h>
#include <cgfs/config/config_manager.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unistd.h>

using namespace cgfs;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        test_dir_ = std::filesystem::temp_directory_path()
                    / ("cgfs_config_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override
    {
        std::filesystem::remove_all(test_dir_);
        ::unsetenv("CGFS_TEST_ROOT");
    }

    std::filesystem::path writeFile(const std::string& name, const std::string& content)
    {
        auto path = test_dir_ / name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    std::filesystem::path test_dir_;
    ConfigManager config_;
};

TEST_F(ConfigManagerTest, SetAndGetTypedValues)
{
    config_.set("proc_root", std::string("/proc"));
    config_.set("threads", 4);
    config_.set("fuse.foreground", true);
    config_.set("ratio", 0.5);

    EXPECT_EQ(config_.get<std::string>("proc_root"), "/proc");
    EXPECT_EQ(config_.get<int>("threads"), 4);
    EXPECT_TRUE(config_.get<bool>("fuse.foreground"));
    EXPECT_DOUBLE_EQ(config_.get<double>("ratio"), 0.5);
    EXPECT_EQ(config_.size(), 4u);
}

TEST_F(ConfigManagerTest, MissingKeyThrowsOrFallsBack)
{
    EXPECT_EQ(config_.get<std::string>("absent", std::string("fallback")), "fallback");

    try {
        config_.get<std::string>("absent");
        FAIL() << "Expected FsError";
    }
    catch (const FsError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::CONFIG_MISSING);
    }
}

TEST_F(ConfigManagerTest, TypeMismatchIsConfigInvalid)
{
    config_.set("fuse.foreground", std::string("yes"));
    try {
        config_.get<bool>("fuse.foreground");
        FAIL() << "Expected FsError";
    }
    catch (const FsError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::CONFIG_INVALID);
    }
}

TEST_F(ConfigManagerTest, JsonObjectsFlattenToDottedKeys)
{
    config_.loadFromJsonString(R"({
        "mountpoint": "/var/lib/cgfs",
        "log": {"level": "debug", "file": "/var/log/cgfs.log"},
        "fuse": {"foreground": true, "threads": 8}
    })");

    EXPECT_EQ(config_.get<std::string>("mountpoint"), "/var/lib/cgfs");
    EXPECT_EQ(config_.get<std::string>("log.level"), "debug");
    EXPECT_EQ(config_.get<std::string>("log.file"), "/var/log/cgfs.log");
    EXPECT_TRUE(config_.get<bool>("fuse.foreground"));
    EXPECT_EQ(config_.get<int>("fuse.threads"), 8);
}

TEST_F(ConfigManagerTest, LoadReplacesAndMergeOverrides)
{
    config_.set("stale", 1);
    config_.loadFromJsonString(R"({"log": {"level": "info"}, "proc_root": "/proc"})");
    EXPECT_FALSE(config_.has("stale"));

    config_.mergeFromJsonString(R"({"log": {"level": "error"}})");
    EXPECT_EQ(config_.get<std::string>("log.level"), "error");
    EXPECT_EQ(config_.get<std::string>("proc_root"), "/proc");
}

TEST_F(ConfigManagerTest, MalformedJsonIsRejected)
{
    EXPECT_THROW(config_.loadFromJsonString("{\"log\": "), FsError);
    EXPECT_THROW(config_.loadFromJsonString("[1, 2]"), FsError);
    EXPECT_THROW(config_.loadFromJsonString(R"({"controllers": ["cpuset"]})"), FsError);
}

TEST_F(ConfigManagerTest, LoadFromFile)
{
    auto path = writeFile("cgfs.json", R"({"cgroup_root": "/sys/fs/cgroup"})");
    config_.loadFromJsonFile(path);
    EXPECT_EQ(config_.get<std::string>("cgroup_root"), "/sys/fs/cgroup");

    try {
        config_.loadFromJsonFile(test_dir_ / "missing.json");
        FAIL() << "Expected FsError";
    }
    catch (const FsError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::CONFIG_MISSING);
    }
}

TEST_F(ConfigManagerTest, JsonRoundTripKeepsNesting)
{
    config_.set("log.level", std::string("warning"));
    config_.set("fuse.allow_other", false);

    auto json = nlohmann::json::parse(config_.toJsonString());
    EXPECT_EQ(json["log"]["level"], "warning");
    EXPECT_EQ(json["fuse"]["allow_other"], false);
}

TEST_F(ConfigManagerTest, EnvironmentExpansion)
{
    ::setenv("CGFS_TEST_ROOT", "/srv/fake", 1);
    config_.set("proc_root", std::string("${CGFS_TEST_ROOT}/proc"));
    config_.set("cgroup_root", std::string("${CGFS_TEST_UNSET_VARIABLE}/cgroup"));
    config_.set("fuse.foreground", true);

    ConfigManager expanded = config_.expandEnvironmentVariables();
    EXPECT_EQ(expanded.get<std::string>("proc_root"), "/srv/fake/proc");
    EXPECT_EQ(expanded.get<std::string>("cgroup_root"), "${CGFS_TEST_UNSET_VARIABLE}/cgroup");
    EXPECT_TRUE(expanded.get<bool>("fuse.foreground"));
}

TEST_F(ConfigManagerTest, SchemaValidation)
{
    ConfigSchema schema = {{"log.level", ConfigValueType::STRING},
                           {"fuse.foreground", ConfigValueType::BOOLEAN}};

    config_.set("log.level", std::string("debug"));
    EXPECT_NO_THROW(config_.validate(schema));

    config_.set("fuse.foreground", 1);
    EXPECT_THROW(config_.validate(schema), FsError);
}
