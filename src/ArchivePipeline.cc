
#include <errno.h>
#include <algorithm>
#include <fstream>
#include <vector>

#include "ArchivePipeline.h"
#include "util_generic.h"
#include "debug.h"


string archiveStateName(archiveState state) {
    switch (state) {
        case asIdle:          return "idle";
        case asVerifying:     return "verifying";
        case asScrubbing:     return "scrubbing";
        case asUnmounting:    return "unmounting";
        case asWaitingDrain:  return "waiting for drain";
        case asTransferring:  return "transferring";
        case asDone:          return "done";
        case asAborted:       return "aborted";
    }

    return "unknown";
}


ArchivePipeline::ArchivePipeline(const Configuration& cfg, Filesystem& filesystem, MountTable& mountTable, CommandRunner& commandRunner,
                                 Scrubber& sensitiveScrubber, ExitReporter& exitReporter) :
    config(cfg), fs(filesystem), mounts(mountTable), runner(commandRunner), scrubber(sensitiveScrubber), reporter(exitReporter) {

    state = asIdle;
}


archiveResult ArchivePipeline::finish(exitOutcome outcome, int transferStatus) {
    archiveResult result = { outcome, state, transferStatus };

    if (outcome != EO_SUCCESS) {
        DEBUG(D_archive) DFMT("aborted while " << archiveStateName(state) << " (" << outcomeName(outcome) << ")");
        state = asAborted;
    }
    else
        state = asDone;

    return result;
}


bool ArchivePipeline::isEmpty(string dir) {
    vector<string> entries;
    int err = fs.listDirectory(dir, entries);

    if (err == ENOENT)
        return true;

    return !err && entries.empty();
}


archiveResult ArchivePipeline::runArchive(string cleartextDir, string encryptedDir, string remoteName) {
    reporter.note("archiving " + encryptedDir + " to " + remoteName);
    state = asVerifying;

    string clear = fs.resolve(cleartextDir);
    string src = fs.resolve(encryptedDir);
    string conf = config.value(sRcloneConf);

    reporter.setting("cleartext to archive", cleartextDir);
    reporter.setting("folder to archive", encryptedDir);
    reporter.setting("remote", remoteName);
    reporter.setting("remote configuration", conf);

    reporter.requireSetting("remote", remoteName);
    reporter.requireContains(conf, remoteName);

    if (!clear.length() || fs.typeOf(clear) != etDirectory) {
        reporter.note("cannot find " + cleartextDir);
        return finish(EO_MISSING_FOLDER);
    }

    if (!src.length() || fs.typeOf(src) != etDirectory) {
        reporter.note("cannot find " + encryptedDir);
        return finish(EO_MISSING_FOLDER);
    }

    string device = CRYFS_DEVICE + src;
    if (!mounts.isMounted(device, clear)) {
        reporter.note(src + " not mounted, cannot check security");
        return finish(EO_MISSING_MOUNT);
    }

    state = asScrubbing;
    auto scrubbed = scrubber.scrub(clear, reporter);
    if (!scrubbed.ok()) {
        reporter.error("failed to remove sensitive data from " + clear + ": " + scrubStatusName(scrubbed));
        return finish(scrubbed.status == srUnsafe ? EO_UNSAFE : EO_SECURITY_FAILURE);
    }

    writeManifest(clear, src);

    state = asUnmounting;
    if (int rc = runner.run({"cryfs-unmount", clear}))
        reporter.escalate(EO_SECURITY_FAILURE, "unmounting encrypted archive exited with code " + to_string(rc) + "; no sync if archive is mounted");

    state = asWaitingDrain;
    int attempts = config.integer(sDrainAttempts);
    double wait = config.decimal(sWait);

    for (int attempt = 0; mounts.isMounted(device, clear); ++attempt) {
        if (attempt >= attempts) {
            reporter.error(src + " is still mounted after " + plural(attempts, "check"));
            return finish(EO_DRAIN_TIMEOUT);
        }

        reporter.note(src + " is mounted");
        sleepFor(wait);
    }

    for (int attempt = 0; !isEmpty(clear); ++attempt) {
        if (attempt >= attempts) {
            reporter.error(clear + " is still not empty after " + plural(attempts, "check"));
            return finish(EO_DRAIN_TIMEOUT);
        }

        reporter.note(clear + " is not empty");
        sleepFor(wait);
    }

    state = asTransferring;
    int rc = runner.run({"rclone", "sync",
                         "--config", conf,
                         "--progress",
                         "--transfers", to_string(config.integer(sTransfers)),
                         "--delete-excluded",
                         "--exclude", CRYFS_CONFIG,
                         src + "/",
                         remoteName + ":"}, true);
    reporter.report(rc, "sync archive to remote");

    return finish(EO_SUCCESS, rc);
}


archiveResult ArchivePipeline::runGeneralArchive() {
    return runArchive(config.value(sArchiveClear), config.value(sArchiveSource), config.value(sArchiveRemote));
}


archiveResult ArchivePipeline::runMonthlyArchive(string month) {
    string monthDir = slashConcat(config.value(sDataRoot), month);

    if (fs.typeOf(monthDir) != etDirectory) {
        DEBUG(D_archive) DFMT("no monthly set at " << monthDir);
        state = asIdle;
        return { EO_SUCCESS, asIdle, 0 };
    }

    string remote = config.value(sMonthlyRemote, month);
    reporter.requireSetting(CFG_MONTHLY_REMOTE, remote);

    return runArchive(slashConcat(monthDir, "clear"), slashConcat(monthDir, "offload"), remote);
}


string ArchivePipeline::writeManifest(string cleartextDir, string encryptedDir) {
    string filename = slashConcat(config.value(sManifestDir), GLOBALS.stamp + "-" + pathAsName(encryptedDir) + ".txt");
    vector<string> listing;
    size_t dirs = 0;
    size_t files = 0;
    size_t prefix = cleartextDir.length() + (cleartextDir.back() == '/' ? 0 : 1);

    int failures = fs.walk(cleartextDir, [&](const string& path, entryType type, unsigned int depth) {
        if (type == etDirectory) {
            ++dirs;
            listing.push_back(path.substr(prefix) + "/");
        }
        else {
            ++files;
            listing.push_back(path.substr(prefix));
        }

        return true;
    });

    sort(listing.begin(), listing.end());

    ofstream manifest;
    manifest.open(filename, ios::app);

    if (!manifest.is_open()) {
        reporter.report(1, "save the tree of archived folders to " + filename);
        return filename;
    }

    manifest << CRYFS_DEVICE << encryptedDir << " " << cleartextDir << endl;
    manifest << cleartextDir << endl;

    for (auto &entry: listing)
        manifest << entry << endl;

    manifest << endl << dirs << (dirs == 1 ? " directory, " : " directories, ") << plural(files, "file") << endl;
    manifest.close();

    if (failures)
        reporter.report(failures, "save the tree of archived folders");

    DEBUG(D_archive) DFMT("manifest " << filename << ": " << listing.size() << " entries");
    return filename;
}


int ArchiveCleanup::operator()(StatusReporter& cleanupReporter) {
    runner.terminate("rclone", cleanupReporter);
    return 0;
}
