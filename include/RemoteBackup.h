
#ifndef REMOTEBACKUP_H
#define REMOTEBACKUP_H

#include <string>

#include "CommandRunner.h"
#include "Configuration.h"
#include "report.h"

using namespace std;


/*
 RemoteBackup rsyncs each configured source to a machine we administer.  A
 source is only sent once its .exclude_remote names every secret folder it
 actually contains.
 */
class RemoteBackup {
    const Configuration& config;
    CommandRunner& runner;
    ExitReporter& reporter;

public:
    RemoteBackup(const Configuration& cfg, CommandRunner& commandRunner, ExitReporter& exitReporter);

    // every configured source to the configured destination; returns the number of failed transfers
    int runAll();

    // returns rsync's exit status
    int run(string source, string destination);
};


class RemoteBackupCleanup {
    CommandRunner& runner;

public:
    RemoteBackupCleanup(CommandRunner& commandRunner) : runner(commandRunner) {}

    int operator()(StatusReporter& cleanupReporter);
};

#endif
