
#ifndef INSTANCELOCK_H
#define INSTANCELOCK_H

#include <string>
#include <tuple>
#include <time.h>

using namespace std;

enum lockStatus { lsAcquired, lsHeld, lsError };


/*
 InstanceLock keeps two runs against the same configuration from overlapping.
 The lock is an flock() on <cachedir>/<md5 of key>.lock, which the kernel
 drops when the process exits however it exits.  The file also carries the
 holder's pid and start time for the refusal message.
 */
class InstanceLock {
    string lockFilename;
    int fd;

public:
    InstanceLock(string cacheDir, string key);
    ~InstanceLock();

    lockStatus acquire();
    void release();

    // pid and start time recorded by the current holder; {0, 0} if unknown
    tuple<int, time_t> holder();

    string filename() { return lockFilename; }
};

#endif
