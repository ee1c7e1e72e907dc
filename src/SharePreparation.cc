
#include <errno.h>
#include <fstream>
#include <vector>

#include "SharePreparation.h"
#include "util_generic.h"
#include "debug.h"


SharePreparation::SharePreparation(const Configuration& cfg, Filesystem& filesystem, PathClassifier& pathClassifier, Scrubber& sensitiveScrubber,
                                   CommandRunner& commandRunner, ExitReporter& exitReporter) :
    config(cfg), fs(filesystem), classifier(pathClassifier), scrubber(sensitiveScrubber), runner(commandRunner), reporter(exitReporter) {
}


exitOutcome SharePreparation::run(string source) {
    string stagingRoot = config.value(sSharedStaging);

    reporter.note("shared preparation of " + source);
    reporter.requireSetting(CFG_SHARED_STAGING, stagingRoot);

    string src = fs.resolve(source);
    if (!src.length())
        reporter.escalate(EO_MISSING_FILE, "cannot find " + source);

    string stagingArea = slashConcat(stagingRoot, pathSplit(src).file);
    if (fs.typeOf(stagingArea) == etMissing && mkdirp(stagingArea))
        reporter.escalate(EO_MISSING_FOLDER, "unable to create " + stagingArea + errtext());

    stagingArea = fs.resolve(stagingArea);

    reporter.setting("directory to backup", src);
    reporter.setting("path to staging areas", stagingArea);
    reporter.requireExists(slashConcat(src, ".include_shared"));

    auto safety = classifier.classify(stagingArea);
    if (safety != pcAllowed)
        reporter.escalate(EO_UNSAFE, "unsafe to clear out " + stagingArea + ": " + pathClassName(safety));

    // folders in the staging area are rebuilt from scratch; loose files stay
    vector<string> entries;
    if (int err = fs.listDirectory(stagingArea, entries))
        reporter.report(err, "listing " + stagingArea);

    for (auto &entry: entries) {
        string path = slashConcat(stagingArea, entry);

        if (fs.typeOf(path) == etDirectory) {
            DEBUG(D_share) DFMT("clearing " << path);

            if (int failures = fs.removeTree(path))
                reporter.report(failures, "removing " + path);
        }
    }

    ifstream includes(slashConcat(src, ".include_shared"));
    string line;

    while (getline(includes, line)) {
        string folder = trimSpace(line);
        if (!folder.length())
            continue;

        string folderPath = slashConcat(src, folder);
        reporter.requireExists(folderPath);

        string resolved = fs.resolve(folderPath);
        if (pathWithin(stagingArea, resolved.length() ? resolved : folderPath))
            reporter.escalate(EO_BAD_CONFIGURATION, stagingArea + " is in " + folderPath);

        string target = slashConcat(stagingArea, folder);
        if (mkdirp(target))
            reporter.report(errno, "creating " + target);

        DEBUG(D_share) DFMT("staging " << folderPath << " -> " << target);
        int rc = runner.run({"rsync", "-av",
                             "--links",
                             "--progress",
                             "--delete",
                             folderPath + "/",
                             target + "/"}, true);
        reporter.report(rc, "staging files via rsync");
    }

    auto scrubbed = scrubber.scrub(stagingRoot, reporter);
    if (scrubbed.status == srUnsafe)
        return EO_UNSAFE;

    if (scrubbed.status == srPartialFailure) {
        reporter.error("sensitive data may remain in " + stagingRoot + ": " + scrubStatusName(scrubbed));
        return EO_SECURITY_FAILURE;
    }

    return EO_SUCCESS;
}


size_t SharePreparationCleanup::writeFileCount() {
    string stagingRoot = config.value(sSharedStaging);
    string countFile = slashConcat(stagingRoot, FILE_COUNT);
    size_t count = fs.countFiles(stagingRoot);

    if (fs.typeOf(countFile) == etFile)
        --count;

    ofstream output(countFile, ios::trunc);
    if (!output.is_open()) {
        log("error: unable to write " + countFile + errtext());
        return count;
    }

    output << count << endl;
    DEBUG(D_share) DFMT(countFile << ": " << count);
    return count;
}


int SharePreparationCleanup::operator()(StatusReporter& cleanupReporter) {
    runner.terminate("rsync", cleanupReporter);

    string stagingRoot = config.value(sSharedStaging);
    if (!stagingRoot.length() || fs.typeOf(stagingRoot) != etDirectory)
        return 0;

    auto scrubbed = scrubber.scrub(stagingRoot, cleanupReporter);
    writeFileCount();

    return scrubbed.ok() ? 0 : 1;
}
