
#ifndef SCRUBBER_H
#define SCRUBBER_H

#include <string>
#include <vector>

#include "pcre++.h"
#include "Filesystem.h"
#include "PathClassifier.h"
#include "report.h"

using namespace std;
using namespace pcrepp;


struct ScrubPolicy {
    vector<string> secretFolders;       // exact basenames, always removed
    vector<string> secretFiles;         // basename globs, always removed
    vector<string> sensitiveFolders;    // exact basenames, never shared
};

enum scrubStatus { srOK, srUnsafe, srPartialFailure };

struct scrubResult {
    scrubStatus status;
    int failedPasses;

    bool ok() const { return status == srOK; }
};


/*******************************************************************************
 * Scrubber
 *
 * Removes every entry below a staging directory whose name matches the
 * secret or sensitive patterns.  The staging directory must classify as
 * allowed; anything else is refused before a single entry is touched.
 *
 * Each pattern gets its own full walk of the tree.  Symbolic links are never
 * followed: a matching link is unlinked, a matching directory is removed
 * with everything in it and a matching regular file is unlinked.  A pass
 * that hits an error is counted and the remaining passes still run.
 *******************************************************************************/
class Scrubber {
    Filesystem& fs;
    PathClassifier& classifier;
    ScrubPolicy policy;
    vector<Pcre> fileMatchers;

    bool folderPass(string root, string name);
    bool filePass(string root, string glob, Pcre& matcher);

public:
    Scrubber(Filesystem& filesystem, PathClassifier& pathClassifier, ScrubPolicy scrubPolicy);

    scrubResult scrub(string stagingPath, StatusReporter& reporter);
};

string scrubStatusName(scrubResult result);

#endif
