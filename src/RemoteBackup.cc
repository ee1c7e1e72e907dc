
#include "RemoteBackup.h"
#include "util_generic.h"


RemoteBackup::RemoteBackup(const Configuration& cfg, CommandRunner& commandRunner, ExitReporter& exitReporter) :
    config(cfg), runner(commandRunner), reporter(exitReporter) {
}


int RemoteBackup::runAll() {
    string destination = config.value(sRemoteBackup);
    string homeExcludes = slashConcat(config.home(), ".exclude_remote");

    reporter.requireSetting(CFG_REMOTE_BACKUP, destination);
    reporter.setting("destination for a " + hostname() + " backup set", destination);

    for (auto &folder: config.list(sSecretFolders))
        reporter.requireContains(homeExcludes, folder);

    int failures = 0;
    for (auto &rawSource: string2vectorOnSpace(config.settings[sRemoteSources].value, true)) {
        string source = config.interpolate(rawSource);

        // the current month's set only exists part of the time
        if (rawSource.find(INTERP_MONTH) != string::npos && !isDirectory(source)) {
            reporter.note("skipping " + source + " (not present)");
            continue;
        }

        if (run(source, destination))
            ++failures;
    }

    return failures;
}


int RemoteBackup::run(string source, string destination) {
    string excludes = slashConcat(source, ".exclude_remote");
    string backupDestination = slashConcat(destination, pathSplit(source).file);

    reporter.note("remote backup of " + source);
    reporter.setting("directory to backup", source);
    reporter.setting("address and path of remote backups", destination);
    reporter.requireExists(excludes);

    for (auto &folder: config.list(sSecretFolders))
        if (isDirectory(slashConcat(source, folder)))
            reporter.requireContains(excludes, folder);

    int rc = runner.run(privileged(config.boolean(sSudo), {"rsync", "-avz",
                        "--links",
                        "--progress",
                        "--delete",
                        "--delete-excluded",
                        "--exclude-from=" + excludes,
                        source + "/",
                        backupDestination + "/"}), true);

    return reporter.report(rc, "remote backup via rsync");
}


int RemoteBackupCleanup::operator()(StatusReporter& cleanupReporter) {
    runner.terminate("rsync", cleanupReporter);
    return 0;
}
