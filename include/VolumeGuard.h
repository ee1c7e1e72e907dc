
#ifndef VOLUMEGUARD_H
#define VOLUMEGUARD_H

#include <map>
#include <string>
#include <vector>

#include "CommandRunner.h"
#include "MountTable.h"
#include "report.h"

using namespace std;


struct EncryptedVolume {
    string name;
    string disk;
    string keyFile;

    string mapper() const { return "/dev/mapper/" + name; }
    string mountpoint() const { return "/mnt/" + name; }
};


/*******************************************************************************
 * VolumeGuard
 *
 * Unlocks, checks and mounts LUKS volumes and guarantees the reverse on the
 * way out.  A volume is remembered from the moment its unlock is attempted so
 * that a signal arriving mid-open still finds it.  closeAll() first stops any
 * cryptsetup, fsck, mount or umount still in flight and waits for it, so an
 * unlock can't complete behind the close.  Closing always unmounts first and
 * never closes a container whose mapping is still mounted; states that are
 * already released are skipped quietly.
 *******************************************************************************/
class VolumeGuard {
    CommandRunner& runner;
    MountTable& mounts;
    bool useSudo;
    map<string, EncryptedVolume> volumes;

public:
    VolumeGuard(CommandRunner& commandRunner, MountTable& mountTable, bool sudo = true);

    // unlock, fsck and mount disk as name.  returns 0 once the volume is mounted
    // at /mnt/<name>, otherwise the failing exit status (the volume is closed again).
    int openVolume(string disk, string keyFile, string name, StatusReporter& reporter);

    // returns 0 when name is neither mounted nor open afterwards
    int closeVolume(string name, StatusReporter& reporter);

    // stop the volume tools still running, then close everything this guard
    // opened.  returns the number of volumes left open.
    int closeAll(StatusReporter& reporter);

    bool isTracked(string name) { return volumes.find(name) != volumes.end(); }
};


// closes its volume when it leaves scope
class ScopedVolume {
    VolumeGuard& guard;
    StatusReporter& reporter;
    string name;
    int openStatus;

public:
    ScopedVolume(VolumeGuard& volumeGuard, string disk, string keyFile, string volumeName, StatusReporter& statusReporter);
    ~ScopedVolume();

    bool mounted() const { return openStatus == 0; }
    int status() const { return openStatus; }
    string mountpoint() const { return "/mnt/" + name; }
};

#endif
