
#include <time.h>
#include <unistd.h>

#include "globals.h"
#include "util_generic.h"

struct global_vars GLOBALS;


void initGlobals() {
    char buffer[32];

    GLOBALS.pid = getpid();
    GLOBALS.startupTime = time(NULL);

    strftime(buffer, sizeof(buffer), "%Y%m%d", localtime(&GLOBALS.startupTime));
    GLOBALS.stamp = string(buffer) + "-" + hostname();

    strftime(buffer, sizeof(buffer), "%Y%m", localtime(&GLOBALS.startupTime));
    GLOBALS.month = buffer;
}

