
#include <errno.h>
#include <fcntl.h>
#include <fstream>
#include <string.h>
#include <sys/file.h>
#include <unistd.h>

#include "InstanceLock.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"


InstanceLock::InstanceLock(string cacheDir, string key) {
    lockFilename = slashConcat(cacheDir, MD5string(key) + ".lock");
    fd = -1;
}


InstanceLock::~InstanceLock() {
    release();
}


lockStatus InstanceLock::acquire() {
    if (fd >= 0)
        return lsAcquired;

    mkdirp(pathSplit(lockFilename).dir);

    if ((fd = open(lockFilename.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644)) < 0) {
        log("error: unable to open lock file " + lockFilename + errtext());
        return lsError;
    }

    int result;
    while ((result = flock(fd, LOCK_EX | LOCK_NB)) != 0 && errno == EINTR);

    if (result) {
        int err = errno;
        close(fd);
        fd = -1;

        if (err == EWOULDBLOCK) {
            DEBUG(D_lock) DFMT(lockFilename << " is held by another process");
            return lsHeld;
        }

        log("error: unable to lock " + lockFilename + " - " + strerror(err));
        return lsError;
    }

    string contents = to_string(GLOBALS.pid) + "\n" + to_string(GLOBALS.startupTime) + "\n";
    if (ftruncate(fd, 0) || write(fd, contents.c_str(), contents.length()) != (ssize_t)contents.length())
        log("warning: unable to record pid in " + lockFilename + errtext());

    DEBUG(D_lock) DFMT("locked " << lockFilename);
    return lsAcquired;
}


void InstanceLock::release() {
    if (fd < 0)
        return;

    // the file stays behind; only the flock matters
    flock(fd, LOCK_UN);
    close(fd);
    fd = -1;

    DEBUG(D_lock) DFMT("released " << lockFilename);
}


tuple<int, time_t> InstanceLock::holder() {
    ifstream lockFile;
    lockFile.open(lockFilename);

    if (lockFile.is_open()) {
        long pid = 0;
        long startTime = 0;

        if (lockFile >> pid >> startTime)
            return {(int)pid, (time_t)startTime};
    }

    return {0, 0};
}
