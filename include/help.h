
#ifndef HELP_H
#define HELP_H

#include "globals.h"
#include "Configuration.h"

// hDefaults prints config's settings (the built-in defaults if config is NULL)
void showHelp(enum helpType kind, Configuration *config = NULL);

#endif
