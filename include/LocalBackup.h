
#ifndef LOCALBACKUP_H
#define LOCALBACKUP_H

#include <string>

#include "CommandRunner.h"
#include "Configuration.h"
#include "VolumeGuard.h"
#include "report.h"

using namespace std;


// mirror the home directory onto the encrypted backup disks that are attached
class LocalBackup {
    const Configuration& config;
    VolumeGuard& guard;
    CommandRunner& runner;
    ExitReporter& reporter;

    int backupTo(string disk, string name, string description);

public:
    LocalBackup(const Configuration& cfg, VolumeGuard& volumeGuard, CommandRunner& commandRunner, ExitReporter& exitReporter);

    // returns the number of attached disks that couldn't be brought up to date
    int run();
};


// stops rsync and closes every volume the guard still tracks
class LocalBackupCleanup {
    VolumeGuard& guard;
    CommandRunner& runner;

public:
    LocalBackupCleanup(VolumeGuard& volumeGuard, CommandRunner& commandRunner) : guard(volumeGuard), runner(commandRunner) {}

    int operator()(StatusReporter& cleanupReporter);
};

#endif
