
#ifndef REPORT_H
#define REPORT_H

#include <string>

#include "globals.h"
#include "exitcodes.h"

using namespace std;

class CleanupRegistry;


/*
 StatusReporter writes operator-facing lines prefixed with the run stamp and
 mirrors them to the log.  It never ends the process, which makes it the only
 reporter handed to cleanup callbacks.
 */
class StatusReporter {
protected:
    string stamp;

public:
    StatusReporter(string runStamp = "");
    virtual ~StatusReporter() {}

    void note(string message);
    void error(string message);
    void setting(string description, string value);

    // report a subprocess result and carry on; returns rc
    int report(int rc, string description);
};


class ExitReporter : public StatusReporter {
    CleanupRegistry& registry;

public:
    ExitReporter(CleanupRegistry& cleanup, string runStamp = "");

    // run the cleanup sequence and exit with code.  throws VSException
    // when called while the cleanup sequence is already running.
    [[noreturn]] void escalate(int code, string message);

    void requireSetting(string name, string value);
    void requireExists(string path);
    void requireDirectory(string path);
    void requireContains(string filename, string needle);
};

#endif
