#include "test_helpers.hpp"
#include "es_error.hpp"
#include "es_target_config.hpp"

using namespace envstage;
using envstage::test::TempTreeTest;

class TargetConfigTests : public TempTreeTest {};

TEST_F(TargetConfigTests, PrefersProjectDirectory) {
    Write("Proj/sub/App.config", "nested");
    Write("Proj/app.config", "top");

    EXPECT_EQ(Read(FindTargetConfig(root_ / "Proj", "App.config")), "top");
}

TEST_F(TargetConfigTests, FallsBackToRecursiveSearchSkippingExcluded) {
    Write("Proj/.Deploy/Portfolio/App.config", "deploy copy");
    Write("Proj/Config/App.config", "real");

    auto found = FindTargetConfig(root_ / "Proj", "App.config", { root_ / "Proj" / ".Deploy" });
    EXPECT_EQ(Read(found), "real");
}

TEST_F(TargetConfigTests, MissingTargetIsNotFound) {
    MakeDir("Proj");
    try {
        FindTargetConfig(root_ / "Proj", "App.config");
        FAIL() << "expected TargetConfigNotFound";
    } catch (const DeployError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TargetConfigNotFound);
    }
}

TEST_F(TargetConfigTests, BackupThenWrite) {
    auto target = Write("Proj/App.config", "old");

    StageResult r = BackupAndWrite(target, "new");
    EXPECT_TRUE(r.written);
    ASSERT_FALSE(r.backup_file.empty());
    EXPECT_EQ(Read(r.backup_file), "old");
    EXPECT_EQ(Read(target), "new");
    EXPECT_EQ(r.backup_file.parent_path(), target.parent_path());
    EXPECT_EQ(r.backup_file.extension().string(), ".bak");
}

TEST_F(TargetConfigTests, IdenticalContentIsNotRewritten) {
    auto target = Write("Proj/App.config", "same");

    StageResult r = BackupAndWrite(target, "same");
    EXPECT_FALSE(r.written);
    EXPECT_TRUE(r.backup_file.empty());
    EXPECT_EQ(CountFiles(), 1u);
}

TEST_F(TargetConfigTests, BackupsWithinOneSecondDoNotCollide) {
    auto target = Write("Proj/App.config", "v1");
    const auto now = std::chrono::system_clock::now();

    StageResult a = BackupAndWrite(target, "v2", now);
    StageResult b = BackupAndWrite(target, "v3", now);
    EXPECT_NE(a.backup_file, b.backup_file);
    EXPECT_EQ(Read(a.backup_file), "v1");
    EXPECT_EQ(Read(b.backup_file), "v2");
}

TEST_F(TargetConfigTests, BackupNameCarriesTimestamp) {
    const auto p = BackupPathFor("/x/App.config", std::chrono::system_clock::now());
    const std::string name = p.filename().string();
    // App.config.YYYYMMDD-HHMMSS.bak
    EXPECT_EQ(name.rfind("App.config.", 0), 0u);
    EXPECT_EQ(name.size(), std::string("App.config.").size() + 15 + 4);
}
