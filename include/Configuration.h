
#ifndef CONFIGURATION_H
#define CONFIGURATION_H

#include <vector>
#include <string>
#include <pcre++.h>
#include "Setting.h"
#include "Scrubber.h"
#include "globals.h"


using namespace std;
using namespace pcrepp;


/*
 Configuration is loaded once at startup and then handed to each component as
 a const reference.  The typed accessors interpolate {home}, {host} and
 {month} on the way out; settings[] keeps the raw text as written.
 */
class Configuration {

public:
    string config_filename;
    vector<Setting> settings;

    Configuration();

    // returns false if filename can't be opened.  throws VSException naming
    // the file and line on an unrecognized setting or an unparsable value.
    bool loadConfig(string filename);

    string home() const;
    string interpolate(string text, string month = "") const;

    string value(SetSpecifier which, string month = "") const;
    vector<string> list(SetSpecifier which, string month = "") const;
    int integer(SetSpecifier which) const;
    double decimal(SetSpecifier which) const;
    bool boolean(SetSpecifier which) const;

    ScrubPolicy scrubPolicy() const;
};

#endif
