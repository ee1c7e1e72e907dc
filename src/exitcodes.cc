
#include "exitcodes.h"


string outcomeName(int code) {
    switch (code) {
        case EO_SUCCESS:             return "success";
        case EO_MISSING_INPUT:       return "missing input";
        case EO_MISSING_FILE:        return "missing file";
        case EO_MISSING_FOLDER:      return "missing folder";
        case EO_MISSING_MOUNT:       return "missing mount";
        case EO_BAD_CONFIGURATION:   return "bad configuration";
        case EO_UNSAFE:              return "unsafe";
        case EO_SYSTEM_UNIT_FAILURE: return "system unit failure";
        case EO_SECURITY_FAILURE:    return "security failure";
        case EO_NETWORK_ERROR:       return "network error";
        case EO_DRAIN_TIMEOUT:       return "drain timeout";
        case EO_LOCKED:              return "locked";
        case EO_TRAPPED_SIGNAL:      return "trapped signal";
    }

    return "code " + to_string(code);
}
