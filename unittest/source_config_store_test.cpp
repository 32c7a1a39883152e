#include <gtest/gtest.h>
#include "backup/backup_config.hpp"
#include "backup/source_config_store.hpp"
#include "test_support.hpp"
#include <cstdlib>

using json = nlohmann::json;
using testsupport::TempDir;

class SourceConfigStoreTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(SourceConfigStoreTest, MissingFileYieldsNoSources) {
    SourceConfigStore store(dir_.file("config.json"));
    EXPECT_TRUE(store.loadSources().empty());
}

TEST_F(SourceConfigStoreTest, MalformedFileYieldsNoSources) {
    testsupport::writeFile(dir_.file("config.json"), "[\"/a\",");
    SourceConfigStore store(dir_.file("config.json"));
    EXPECT_TRUE(store.loadSources().empty());
}

TEST_F(SourceConfigStoreTest, SkipsNonStringEntries) {
    testsupport::writeFile(dir_.file("config.json"), R"({"sources": ["/srv/a", 7, null, "/srv/b"]})");
    SourceConfigStore store(dir_.file("config.json"));
    EXPECT_EQ(store.loadSources(), (std::vector<std::string>{"/srv/a", "/srv/b"}));
}

TEST_F(SourceConfigStoreTest, SaveThenLoadKeepsOrder) {
    SourceConfigStore store(dir_.file("state/config.json"));
    std::vector<std::string> sources{"/home/user/photos", "/etc", "/home/user/documents"};
    ASSERT_TRUE(store.saveSources(sources));
    EXPECT_EQ(store.loadSources(), sources);

    json raw = json::parse(testsupport::readFile(dir_.file("state/config.json")));
    EXPECT_EQ(raw["sources"].size(), 3u);
}

TEST_F(SourceConfigStoreTest, RejectsRelativePaths) {
    SourceConfigStore store(dir_.file("config.json"));
    EXPECT_FALSE(store.saveSources({"/srv/a", "relative/path"}));
    EXPECT_EQ(store.getLastError(), "Source path must be absolute: 'relative/path'");
    EXPECT_FALSE(std::filesystem::exists(dir_.file("config.json")));
}

TEST(EngineSettingsTest, ReadsEnvironment) {
    setenv("SMB_SERVER", "nas.local", 1);
    setenv("SMB_SHARE", "backups", 1);
    setenv("SMB_MOUNT_POINT", "/mnt/test", 1);
    setenv("BACKUP_ELEVATION", "sudo -n", 1);
    setenv("BACKUP_STDBUF", "", 1);

    EngineSettings settings = EngineSettings::fromEnvironment();
    EXPECT_EQ(settings.smbServer, "nas.local");
    EXPECT_EQ(settings.smbShare, "backups");
    EXPECT_EQ(settings.mountPoint, "/mnt/test");
    EXPECT_EQ(settings.elevationCommand, (std::vector<std::string>{"sudo", "-n"}));
    EXPECT_TRUE(settings.stdbufPath.empty());
    EXPECT_EQ(settings.rsyncPath, "rsync");

    unsetenv("SMB_SERVER");
    unsetenv("SMB_SHARE");
    unsetenv("SMB_MOUNT_POINT");
    unsetenv("BACKUP_ELEVATION");
    unsetenv("BACKUP_STDBUF");
}

TEST(EngineSettingsTest, EmptyElevationRunsToolsDirectly) {
    setenv("BACKUP_ELEVATION", "", 1);
    EXPECT_TRUE(EngineSettings::fromEnvironment().elevationCommand.empty());
    unsetenv("BACKUP_ELEVATION");
    EXPECT_EQ(EngineSettings::fromEnvironment().elevationCommand, (std::vector<std::string>{"sudo"}));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
