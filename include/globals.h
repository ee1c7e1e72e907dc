#ifndef GLOBALS_H
#define GLOBALS_H

#include "globalsdef.h"

extern struct global_vars GLOBALS;

// fill in the startup time, stamp and month fields
void initGlobals();

#endif

