
#include <fstream>
#include <iostream>
#include <sstream>

#include "report.h"
#include "CleanupRegistry.h"
#include "util_generic.h"
#include "exception.h"
#include "debug.h"


StatusReporter::StatusReporter(string runStamp) {
    stamp = runStamp.length() ? runStamp : GLOBALS.stamp;
}


void StatusReporter::note(string message) {
    log(stamp + ": " + message);

    if (NOTQUIET)
        cerr << stamp << ": " << message << endl;
}


void StatusReporter::error(string message) {
    log(stamp + ": " + message);
    SCREENERR(stamp << ": " << message);
}


void StatusReporter::setting(string description, string value) {
    note(description + " is " + value);
}


int StatusReporter::report(int rc, string description) {
    if (rc) {
        error(description + " exited with code " + to_string(rc));
        note("continuing . . .");
    }

    return rc;
}


ExitReporter::ExitReporter(CleanupRegistry& cleanup, string runStamp) : StatusReporter(runStamp), registry(cleanup) {
}


void ExitReporter::escalate(int code, string message) {
    if (registry.isRunning())
        throw VSException("refusing to escalate (" + message + ") while cleanup is running", to_string(code));

    error(message);
    registry.runCleanup(code);
}


void ExitReporter::requireSetting(string name, string value) {
    if (!trimSpace(value).length())
        escalate(EO_MISSING_INPUT, "required setting " + name + " is empty");

    DEBUG(D_config) DFMT(name << " = " << value);
}


void ExitReporter::requireExists(string path) {
    if (!exists(path))
        escalate(EO_MISSING_FILE, "required file " + path + " is missing");
}


void ExitReporter::requireDirectory(string path) {
    if (!isDirectory(path))
        escalate(EO_MISSING_FOLDER, "required folder " + path + " is missing");
}


void ExitReporter::requireContains(string filename, string needle) {
    ifstream file(filename);

    if (!file.is_open())
        escalate(EO_MISSING_FILE, "required file " + filename + " is missing");

    stringstream content;
    content << file.rdbuf();

    if (content.str().find(needle) == string::npos)
        escalate(EO_BAD_CONFIGURATION, filename + " does not mention " + needle);
}
