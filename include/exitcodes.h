
#ifndef EXITCODES_H
#define EXITCODES_H

#include <string>

using namespace std;

// process exit codes; the numeric values are stable across releases
enum exitOutcome {
    EO_SUCCESS = 0,
    EO_MISSING_INPUT = 3,
    EO_MISSING_FILE = 4,
    EO_MISSING_FOLDER = 5,
    EO_MISSING_MOUNT = 6,
    EO_BAD_CONFIGURATION = 7,
    EO_UNSAFE = 8,
    EO_SYSTEM_UNIT_FAILURE = 9,
    EO_SECURITY_FAILURE = 10,
    EO_NETWORK_ERROR = 11,
    EO_DRAIN_TIMEOUT = 12,
    EO_LOCKED = 13,
    EO_TRAPPED_SIGNAL = 20
};

string outcomeName(int code);

#endif
