
#ifndef SHAREPREPARATION_H
#define SHAREPREPARATION_H

#include <string>

#include "CommandRunner.h"
#include "Configuration.h"
#include "Filesystem.h"
#include "PathClassifier.h"
#include "Scrubber.h"
#include "exitcodes.h"
#include "report.h"

using namespace std;

#define FILE_COUNT "FILE_COUNT"


/*******************************************************************************
 * SharePreparation
 *
 * Builds <shared_staging>/<source name>, a copy of the folders listed in the
 * source's .include_shared with everything secret or sensitive removed, ready
 * for a cloud drive client to pick up.  The staging area is re-scrubbed and
 * FILE_COUNT is refreshed on the way out, however the run ends.
 *******************************************************************************/
class SharePreparation {
    const Configuration& config;
    Filesystem& fs;
    PathClassifier& classifier;
    Scrubber& scrubber;
    CommandRunner& runner;
    ExitReporter& reporter;

public:
    SharePreparation(const Configuration& cfg, Filesystem& filesystem, PathClassifier& pathClassifier, Scrubber& sensitiveScrubber,
                     CommandRunner& commandRunner, ExitReporter& exitReporter);

    exitOutcome run(string source);
};


// stops rsync, re-scrubs the shared staging root and refreshes its FILE_COUNT
class SharePreparationCleanup {
    const Configuration& config;
    Filesystem& fs;
    Scrubber& scrubber;
    CommandRunner& runner;

public:
    SharePreparationCleanup(const Configuration& cfg, Filesystem& filesystem, Scrubber& sensitiveScrubber, CommandRunner& commandRunner) :
        config(cfg), fs(filesystem), scrubber(sensitiveScrubber), runner(commandRunner) {}

    // regular files below the staging root, FILE_COUNT itself excluded
    size_t writeFileCount();

    int operator()(StatusReporter& cleanupReporter);
};

#endif
