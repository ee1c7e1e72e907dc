
#include <stdexcept>

#include "Setting.h"
#include "globals.h"


Setting::Setting(string name, string pattern, enum SetType setType, string defaultVal) {
    regex = Pcre("(?:^|\\s)" + pattern + CAPTURE_VALUE + RE_COMMENT);
    display_name = name;
    data_type = setType;
    defaultValue = defaultVal;
    value = defaultValue;
    seen = false;
}


void Setting::validate() {
    size_t used = 0;

    switch (data_type) {
        case INT:
            stoi(value, &used);
            break;

        case DECIMAL:
            stod(value, &used);
            break;

        default:
            return;
    }

    if (trimSpace(value.substr(used)).length())
        throw invalid_argument("trailing characters in " + value);
}


string Setting::confPrint() {
    bool isDef = value == defaultValue;
    char buffer[1000];

    snprintf(buffer, sizeof(buffer), "%-20s %-40s%s", ((isDef ? "#" : "") + display_name + ":").c_str(),
             (data_type == BOOL ? (str2bool(value) ? "true" : "false") : value).c_str(), isDef ? "  # default" : "");

    return string(buffer) + "\n";
}
