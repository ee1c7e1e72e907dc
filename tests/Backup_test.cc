#include <gtest/gtest.h>

#include "LocalBackup.h"
#include "RemoteBackup.h"
#include "testutil.h"


class BackupTest : public ::testing::Test {
protected:
    TempDir tmp;
    FakeRunner runner;
    FakeMounts mounts;
    Configuration config;
    CleanupRegistry registry{throwingTerminator()};
    ExitReporter reporter{registry};

    string home;

    void SetUp() override {
        quietGlobals();
        ASSERT_FALSE(tmp.path().empty());

        home = tmp.path("alice");
        writeFile(slashConcat(home, ".exclude_local"), ".cache\n");
        writeFile(slashConcat(home, ".exclude_remote"), ".ssh\n.gnupg\n.cache\n");
        writeFile(slashConcat(home, "docs/report.pdf"));
        writeFile(tmp.path("dev/sdb1"), "");

        config.settings[sHome].value = home;
        config.settings[sSecretFolders].value = ".ssh .gnupg";
        config.settings[sKeyFile].value = tmp.path("backup.key");
        config.settings[sBackupDisk].value = tmp.path("dev/sdb1");
        config.settings[sBackupName].value = "backup";
        config.settings[sExtraDisk].value = tmp.path("dev/sdc1");
        config.settings[sExtraName].value = "extra";
        config.settings[sRemoteBackup].value = "vault:/backups";
        config.settings[sRemoteSources].value = "{home}";
        config.settings[sSudo].value = "false";
    }

    int escalation(function<void()> step) {
        try {
            step();
        }
        catch (terminated& t) {
            return t.code;
        }

        return -1;
    }
};


TEST_F(BackupTest, OnlyAttachedDisksAreOpened) {
    VolumeGuard guard(runner, mounts, false);
    LocalBackup backup(config, guard, runner, reporter);

    EXPECT_EQ(0, backup.run());
    EXPECT_NE(-1, runner.indexOf({"cryptsetup", "open", tmp.path("dev/sdb1"), "backup"}));
    EXPECT_EQ(-1, runner.indexOf({"cryptsetup", "open", tmp.path("dev/sdc1")}));
    EXPECT_FALSE(guard.isTracked("backup"));
}


TEST_F(BackupTest, TheHomeIsMirroredOntoTheOpenedDisk) {
    if (!isDirectory("/mnt"))
        GTEST_SKIP() << "no /mnt to route the mountpoint through";

    // /mnt/<name> lands back in the scratch directory
    string name = ".." + tmp.path("volume");
    mkdirp(slashConcat(tmp.path("volume"), "alice"));
    config.settings[sBackupName].value = name;

    VolumeGuard guard(runner, mounts, false);
    LocalBackup backup(config, guard, runner, reporter);

    EXPECT_EQ(0, backup.run());

    int rsync = runner.indexOf({"rsync"});
    ASSERT_GE(rsync, 0);
    EXPECT_EQ("rsync -av --links --progress --delete --delete-excluded --exclude-from=" + home + "/.exclude_local " +
              home + "/ /mnt/" + name + "/alice/", runner.joined(rsync));

    EXPECT_LT(runner.indexOf({"mount"}), rsync);
    EXPECT_GT(runner.indexOf({"cryptsetup", "status"}), rsync);
}


TEST_F(BackupTest, AFailedUnlockCountsAsAFailure) {
    runner.exitCodes["cryptsetup"] = 2;

    VolumeGuard guard(runner, mounts, false);
    LocalBackup backup(config, guard, runner, reporter);

    EXPECT_EQ(1, backup.run());
    EXPECT_EQ(-1, runner.indexOf({"rsync"}));
}


TEST_F(BackupTest, LocalBackupNeedsItsExcludeList) {
    ASSERT_EQ(0, unlink(slashConcat(home, ".exclude_local").c_str()));

    VolumeGuard guard(runner, mounts, false);
    LocalBackup backup(config, guard, runner, reporter);

    EXPECT_EQ(EO_MISSING_FILE, escalation([&]() { backup.run(); }));
    EXPECT_TRUE(runner.calls.empty());
}


TEST_F(BackupTest, LocalCleanupStopsRsyncAndClosesVolumes) {
    VolumeGuard guard(runner, mounts, false);
    LocalBackupCleanup cleanup(guard, runner);
    StatusReporter cleanupReporter;

    ASSERT_EQ(0, guard.openVolume(tmp.path("dev/sdb1"), tmp.path("backup.key"), "backup", cleanupReporter));
    EXPECT_EQ(0, cleanup(cleanupReporter));
    EXPECT_FALSE(guard.isTracked("backup"));
    EXPECT_EQ((vector<string>{"rsync", "cryptsetup", "fsck", "mount", "umount"}), runner.stopped);
}


TEST_F(BackupTest, CleanupsRunFromTheRegistryWithoutAnExitingReporter) {
    VolumeGuard guard(runner, mounts, false);
    StatusReporter openReporter;
    ASSERT_EQ(0, guard.openVolume(tmp.path("dev/sdb1"), tmp.path("backup.key"), "backup", openReporter));

    CleanupRegistry cleanups(throwingTerminator());
    cleanups.registerCleanup("local backup", LocalBackupCleanup(guard, runner));
    cleanups.registerCleanup("remote backup", RemoteBackupCleanup(runner));

    try {
        cleanups.runCleanup(EO_TRAPPED_SIGNAL);
    }
    catch (terminated& t) {
        EXPECT_EQ(EO_TRAPPED_SIGNAL, t.code);
    }

    EXPECT_FALSE(guard.isTracked("backup"));
    EXPECT_EQ((vector<string>{"rsync", "cryptsetup", "fsck", "mount", "umount", "rsync"}), runner.stopped);
}


TEST_F(BackupTest, RemoteBackupSendsEachSource) {
    RemoteBackup backup(config, runner, reporter);

    EXPECT_EQ(0, backup.runAll());
    ASSERT_EQ(1u, runner.calls.size());
    EXPECT_EQ("rsync -avz --links --progress --delete --delete-excluded --exclude-from=" + home + "/.exclude_remote " +
              home + "/ vault:/backups/alice/", runner.joined(0));
}


TEST_F(BackupTest, AnAbsentMonthlySourceIsSkipped) {
    config.settings[sRemoteSources].value = "{home} " + tmp.path("{month}");

    RemoteBackup backup(config, runner, reporter);

    EXPECT_EQ(0, backup.runAll());
    EXPECT_EQ(1u, runner.calls.size());
}


TEST_F(BackupTest, ASecretFolderMissingFromTheExcludesEscalates) {
    writeFile(slashConcat(home, ".exclude_remote"), ".cache\n");

    RemoteBackup backup(config, runner, reporter);

    EXPECT_EQ(EO_BAD_CONFIGURATION, escalation([&]() { backup.runAll(); }));
    EXPECT_TRUE(runner.calls.empty());
}


TEST_F(BackupTest, EachSourceMustExcludeTheSecretsItHolds) {
    string project = tmp.path("project");
    writeFile(slashConcat(project, ".exclude_remote"), ".cache\n");
    writeFile(slashConcat(project, "main.cc"));

    RemoteBackup backup(config, runner, reporter);
    EXPECT_EQ(0, backup.run(project, "vault:/backups"));

    mkdirp(slashConcat(project, ".gnupg"));
    EXPECT_EQ(EO_BAD_CONFIGURATION, escalation([&]() { backup.run(project, "vault:/backups"); }));
}


TEST_F(BackupTest, RemoteFailuresAreCounted) {
    runner.exitCodes["rsync"] = 23;

    RemoteBackup backup(config, runner, reporter);

    EXPECT_EQ(1, backup.runAll());
}
