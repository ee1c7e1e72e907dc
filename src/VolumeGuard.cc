
#include "VolumeGuard.h"
#include "util_generic.h"
#include "debug.h"


VolumeGuard::VolumeGuard(CommandRunner& commandRunner, MountTable& mountTable, bool sudo) :
    runner(commandRunner), mounts(mountTable), useSudo(sudo) {
}


int VolumeGuard::openVolume(string disk, string keyFile, string name, StatusReporter& reporter) {
    EncryptedVolume volume = { name, disk, keyFile };
    int rc;

    reporter.setting("device path for encrypted volume " + name, disk);
    volumes[name] = volume;

    DEBUG(D_volume) DFMT("unlocking " << disk << " as " << name);
    if ((rc = runner.run(privileged(useSudo, {"cryptsetup", "open", "--key-file=" + keyFile, disk, name})))) {
        reporter.report(rc, "unlock " + name);
        volumes.erase(name);
        return rc;
    }

    // advisory: a dirty filesystem is still mounted
    DEBUG(D_volume) DFMT("checking " << volume.mapper());
    if ((rc = runner.run(privileged(useSudo, {"fsck", "-a", volume.mapper()}))))
        reporter.report(rc, "running file system check on " + volume.mapper());

    DEBUG(D_volume) DFMT("mounting " << volume.mapper() << " on " << volume.mountpoint());
    if ((rc = runner.run(privileged(useSudo, {"mount", volume.mapper(), volume.mountpoint()})))) {
        reporter.report(rc, "mount " + name);
        closeVolume(name, reporter);
        return rc;
    }

    return 0;
}


int VolumeGuard::closeVolume(string name, StatusReporter& reporter) {
    EncryptedVolume volume = { name, "", "" };
    int rc;

    if (mounts.isMountpoint(volume.mountpoint())) {
        DEBUG(D_volume) DFMT("unmounting " << volume.mapper());

        if ((rc = runner.run(privileged(useSudo, {"umount", volume.mapper()})))) {
            // the container stays open underneath a live mount
            reporter.report(rc, "unmounting " + name);
            return rc;
        }
    }

    if (!runner.run(privileged(useSudo, {"cryptsetup", "status", name}))) {
        DEBUG(D_volume) DFMT("closing " << name);

        if ((rc = runner.run(privileged(useSudo, {"cryptsetup", "close", name})))) {
            reporter.report(rc, "locking " + name);
            return rc;
        }
    }
    else
        DEBUG(D_volume) DFMT(name << " is not open");

    volumes.erase(name);
    return 0;
}


int VolumeGuard::closeAll(StatusReporter& reporter) {
    vector<string> names;
    int stillOpen = 0;

    for (auto &entry: volumes)
        names.push_back(entry.first);

    // an open, check or mount interrupted by a signal is still running
    if (names.size())
        for (auto tool: {"cryptsetup", "fsck", "mount", "umount"})
            runner.terminate(tool, reporter);

    for (auto &name: names)
        if (closeVolume(name, reporter))
            ++stillOpen;

    return stillOpen;
}


ScopedVolume::ScopedVolume(VolumeGuard& volumeGuard, string disk, string keyFile, string volumeName, StatusReporter& statusReporter) :
    guard(volumeGuard), reporter(statusReporter), name(volumeName) {

    openStatus = guard.openVolume(disk, keyFile, name, reporter);
}


ScopedVolume::~ScopedVolume() {
    if (guard.isTracked(name))
        guard.closeVolume(name, reporter);
}
