
#include "LocalBackup.h"
#include "util_generic.h"
#include "debug.h"


LocalBackup::LocalBackup(const Configuration& cfg, VolumeGuard& volumeGuard, CommandRunner& commandRunner, ExitReporter& exitReporter) :
    config(cfg), guard(volumeGuard), runner(commandRunner), reporter(exitReporter) {
}


int LocalBackup::run() {
    string home = config.home();

    reporter.note("local backup of " + home);
    reporter.requireSetting("date stamp", GLOBALS.stamp);
    reporter.setting("name of the file with encryption key for local backup", config.value(sKeyFile));
    reporter.setting("device path for local encrypted backup", config.value(sBackupDisk));
    reporter.setting("name of the backup", config.value(sBackupName));
    reporter.setting("device path for extra local encrypted backup", config.value(sExtraDisk));
    reporter.setting("name of extra backup", config.value(sExtraName));

    reporter.requireExists(slashConcat(home, ".exclude_local"));

    int failures = 0;
    failures += backupTo(config.value(sBackupDisk), config.value(sBackupName), "local backup") ? 1 : 0;
    failures += backupTo(config.value(sExtraDisk), config.value(sExtraName), "extra local backup") ? 1 : 0;

    return failures;
}


int LocalBackup::backupTo(string disk, string name, string description) {
    if (!disk.length() || !exists(disk)) {
        reporter.note(description + " device not found");
        return 0;
    }

    reporter.requireSetting(description + " name", name);
    reporter.requireSetting(CFG_KEY_FILE, config.value(sKeyFile));

    ScopedVolume volume(guard, disk, config.value(sKeyFile), name, reporter);
    if (!volume.mounted())
        return volume.status();

    string home = config.home();
    string destination = slashConcat(volume.mountpoint(), pathSplit(home).file);

    if (!isDirectory(destination)) {
        reporter.note(description + " destination " + destination + " not found");
        return 0;
    }

    int rc = runner.run(privileged(config.boolean(sSudo), {"rsync", "-av",
                        "--links",
                        "--progress",
                        "--delete",
                        "--delete-excluded",
                        "--exclude-from=" + slashConcat(home, ".exclude_local"),
                        home + "/",
                        destination + "/"}), true);

    return reporter.report(rc, description + " via rsync");
}


int LocalBackupCleanup::operator()(StatusReporter& cleanupReporter) {
    runner.terminate("rsync", cleanupReporter);

    int stillOpen = guard.closeAll(cleanupReporter);
    if (stillOpen)
        cleanupReporter.error(plural(stillOpen, "encrypted volume") + " could not be closed");

    return stillOpen;
}
