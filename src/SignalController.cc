
#include <signal.h>
#include <string.h>

#include "SignalController.h"
#include "util_generic.h"
#include "debug.h"

CleanupRegistry *SignalController::target = NULL;

static const int trappedSignals[] = { SIGHUP, SIGINT, SIGQUIT, SIGABRT, SIGTERM };


void SignalController::install(CleanupRegistry& registry) {
    struct sigaction action;

    target = &registry;

    memset(&action, 0, sizeof(action));
    action.sa_handler = SignalController::handler;
    sigemptyset(&action.sa_mask);

    // no second trapped signal interrupts the handler while it runs
    for (auto sig: trappedSignals)
        sigaddset(&action.sa_mask, sig);

    for (auto sig: trappedSignals)
        if (sigaction(sig, &action, NULL))
            log("warning: unable to trap signal " + to_string(sig) + errtext());

    DEBUG(D_signal) DFMT("signal handlers installed");
}


void SignalController::uninstall() {
    for (auto sig: trappedSignals)
        signal(sig, SIG_DFL);

    target = NULL;
}


void SignalController::handler(int sig) {
    StatusReporter reporter;
    reporter.error("trapped signal " + to_string(sig) + " (" + strsignal(sig) + ")");

    if (target == NULL)
        _exit(EO_TRAPPED_SIGNAL);

    if (target->isRunning()) {
        reporter.note("cleanup already running; ignoring signal " + to_string(sig));
        return;
    }

    target->runCleanup(EO_TRAPPED_SIGNAL);
}
