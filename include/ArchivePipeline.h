
#ifndef ARCHIVEPIPELINE_H
#define ARCHIVEPIPELINE_H

#include <string>

#include "CommandRunner.h"
#include "Configuration.h"
#include "Filesystem.h"
#include "MountTable.h"
#include "Scrubber.h"
#include "exitcodes.h"
#include "report.h"

using namespace std;

enum archiveState { asIdle, asVerifying, asScrubbing, asUnmounting, asWaitingDrain, asTransferring, asDone, asAborted };

struct archiveResult {
    exitOutcome outcome;
    archiveState reached;       // last state entered
    int transferStatus;         // rclone's exit status once transferring
};


/*******************************************************************************
 * ArchivePipeline
 *
 * Sends a cryfs-encrypted directory to object storage.  The cleartext view
 * must be mounted so it can be scrubbed and listed before anything leaves the
 * machine; it's then unmounted, and the encrypted side is synced with rclone
 * only once the mount and the cleartext directory have drained.
 *
 *   Idle -> Verifying -> Scrubbing -> Unmounting -> WaitingDrain -> Transferring -> Done
 *
 * Any state can end in Aborted.  A failed unmount escalates: syncing a
 * source that is still mounted isn't allowed.
 *******************************************************************************/
class ArchivePipeline {
    const Configuration& config;
    Filesystem& fs;
    MountTable& mounts;
    CommandRunner& runner;
    Scrubber& scrubber;
    ExitReporter& reporter;
    archiveState state;

    archiveResult finish(exitOutcome outcome, int transferStatus = 0);
    bool isEmpty(string dir);

public:
    ArchivePipeline(const Configuration& cfg, Filesystem& filesystem, MountTable& mountTable, CommandRunner& commandRunner,
                    Scrubber& sensitiveScrubber, ExitReporter& exitReporter);

    archiveResult runArchive(string cleartextDir, string encryptedDir, string remoteName);

    // the configured general archive set
    archiveResult runGeneralArchive();

    // <data_root>/<month>/clear -> <data_root>/<month>/offload, skipped if <data_root>/<month> doesn't exist
    archiveResult runMonthlyArchive(string month);

    // append the mapping line and a listing of cleartextDir; returns the manifest's filename
    string writeManifest(string cleartextDir, string encryptedDir);

    archiveState currentState() { return state; }
};


// an interrupted transfer is stopped; the cleartext side is left as it is
class ArchiveCleanup {
    CommandRunner& runner;

public:
    ArchiveCleanup(CommandRunner& commandRunner) : runner(commandRunner) {}

    int operator()(StatusReporter& cleanupReporter);
};

string archiveStateName(archiveState state);

#endif
