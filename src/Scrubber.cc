
#include <string.h>

#include "Scrubber.h"
#include "util_generic.h"
#include "debug.h"


string scrubStatusName(scrubResult result) {
    switch (result.status) {
        case srOK:             return "ok";
        case srUnsafe:         return "unsafe";
        case srPartialFailure: return "partial failure (" + to_string(result.failedPasses) + (result.failedPasses == 1 ? " failed pass)" : " failed passes)");
    }

    return "unknown";
}


Scrubber::Scrubber(Filesystem& filesystem, PathClassifier& pathClassifier, ScrubPolicy scrubPolicy) :
    fs(filesystem), classifier(pathClassifier), policy(scrubPolicy) {

    for (auto &glob: policy.secretFiles)
        fileMatchers.push_back(Pcre(globToRegex(glob)));
}


bool Scrubber::folderPass(string root, string name) {
    int failures = 0;

    failures += fs.walk(root, [&](const string& path, entryType type, unsigned int depth) {
        if (pathSplit(path).file != name)
            return true;

        if (type == etSymlink) {
            DEBUG(D_scrub) DFMT("unlinking " << path << " (link)");

            if (int err = fs.removeEntry(path, type)) {
                log("error: unable to unlink " + path + " - " + strerror(err));
                ++failures;
            }

            return false;
        }

        if (type == etDirectory) {
            DEBUG(D_scrub) DFMT("removing " << path << " recursively");
            failures += fs.removeTree(path);
            return false;
        }

        return true;
    });

    return !failures;
}


bool Scrubber::filePass(string root, string glob, Pcre& matcher) {
    int failures = 0;

    failures += fs.walk(root, [&](const string& path, entryType type, unsigned int depth) {
        if ((type != etFile && type != etSymlink) || !matcher.search(pathSplit(path).file))
            return true;

        DEBUG(D_scrub) DFMT("unlinking " << path << " (" << glob << ")");

        if (int err = fs.removeEntry(path, type)) {
            log("error: unable to unlink " + path + " - " + strerror(err));
            ++failures;
        }

        return false;
    });

    return !failures;
}


scrubResult Scrubber::scrub(string stagingPath, StatusReporter& reporter) {
    scrubResult result = { srOK, 0 };

    reporter.setting("path to remove sensitive data", stagingPath);

    auto safety = classifier.classify(stagingPath);
    if (safety != pcAllowed) {
        reporter.error("unsafe to remove sensitive data from " + stagingPath + ": " + pathClassName(safety));
        result.status = srUnsafe;
        return result;
    }

    string root = fs.resolve(stagingPath);
    if (!root.length()) {
        reporter.error("unable to resolve " + stagingPath);
        result.status = srUnsafe;
        return result;
    }

    for (auto &name: policy.secretFolders) {
        DEBUG(D_scrub) DFMT("secret folder to remove: " << name);

        if (!folderPass(root, name)) {
            reporter.report(1, "removing secret folders named " + name);
            ++result.failedPasses;
        }
    }

    for (auto &name: policy.sensitiveFolders) {
        DEBUG(D_scrub) DFMT("sensitive folder to remove: " << name);

        if (!folderPass(root, name)) {
            reporter.report(1, "removing sensitive folders named " + name);
            ++result.failedPasses;
        }
    }

    for (size_t index = 0; index < policy.secretFiles.size(); ++index) {
        DEBUG(D_scrub) DFMT("secret file to remove: " << policy.secretFiles[index]);

        if (!filePass(root, policy.secretFiles[index], fileMatchers[index])) {
            reporter.report(1, "removing secret files matching " + policy.secretFiles[index]);
            ++result.failedPasses;
        }
    }

    if (result.failedPasses)
        result.status = srPartialFailure;

    DEBUG(D_scrub) DFMT(root << ": " << scrubStatusName(result));
    return result;
}
