
#ifndef SIGNALCONTROLLER_H
#define SIGNALCONTROLLER_H

#include "CleanupRegistry.h"


/*******************************************************************************
 * SignalController
 *
 * Traps SIGHUP, SIGINT, SIGQUIT, SIGABRT and SIGTERM and routes each of them
 * into the registry's cleanup sequence with EO_TRAPPED_SIGNAL.  A signal that
 * arrives while the sequence is already running is logged and ignored.
 *******************************************************************************/
class SignalController {
    static CleanupRegistry *target;

public:
    static void install(CleanupRegistry& registry);
    static void uninstall();
    static void handler(int sig);
};

#endif
