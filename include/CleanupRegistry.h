
#ifndef CLEANUPREGISTRY_H
#define CLEANUPREGISTRY_H

#include <functional>
#include <string>
#include <vector>
#include <signal.h>

#include "report.h"

using namespace std;

// a cleanup callback returns 0 when everything it owns was released
typedef function<int(StatusReporter&)> cleanupFunction;
typedef function<void(int)> terminateFunction;


/*
 CleanupRegistry holds the ordered callbacks that release everything the run
 acquired.  runCleanup() is the single exit path for normal completion,
 escalated errors and trapped signals: it runs at most once, calls every
 callback in registration order regardless of earlier failures, then ends the
 process.
 */
class CleanupRegistry {
    struct namedCleanup {
        string name;
        cleanupFunction callback;
    };

    vector<namedCleanup> callbacks;
    volatile sig_atomic_t running;
    terminateFunction terminator;

public:
    CleanupRegistry();
    CleanupRegistry(terminateFunction term);

    void registerCleanup(string name, cleanupFunction callback);

    [[noreturn]] void runCleanup(int exitCode);

    bool isRunning() const { return running != 0; }
    size_t size() const { return callbacks.size(); }
};

#endif
