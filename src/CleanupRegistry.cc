
#include <stdlib.h>
#include <exception>
#include <iostream>

#include "CleanupRegistry.h"
#include "util_generic.h"
#include "exception.h"
#include "debug.h"


CleanupRegistry::CleanupRegistry() : running(0), terminator([](int code) { exit(code); }) {
}


CleanupRegistry::CleanupRegistry(terminateFunction term) : running(0), terminator(term) {
}


void CleanupRegistry::registerCleanup(string name, cleanupFunction callback) {
    DEBUG(D_cleanup) DFMT("registered cleanup #" << callbacks.size() + 1 << " (" << name << ")");
    callbacks.push_back({name, callback});
}


void CleanupRegistry::runCleanup(int exitCode) {
    StatusReporter reporter;
    running = 1;

    if (NOTQUIET)
        cerr << RULE << endl;

    reporter.note("exiting cleanly with code " + to_string(exitCode) + ". . .");

    for (auto &entry: callbacks) {
        DEBUG(D_cleanup) DFMT("running cleanup " << entry.name);

        try {
            int rc = entry.callback(reporter);

            if (rc)
                reporter.error("cleanup " + entry.name + " failed with code " + to_string(rc));
        }
        catch (const VSException& e) {
            reporter.error("cleanup " + entry.name + " aborted: " + e.detail());
        }
        catch (const std::exception& e) {
            reporter.error("cleanup " + entry.name + " aborted: " + e.what());
        }
    }

    reporter.note(". . . all done with code " + to_string(exitCode));

    terminator(exitCode);

    // a terminator that returns still may not resume the run
    exit(exitCode);
}
