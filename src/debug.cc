
#ifndef DEBUG_C
#define DEBUG_C

/* Selector syntax borrowed from:
 * Exim - an Internet mail transport agent
 * Copyright (c) University of Cambridge 1995 - 2018
 * Copyright (c) The Exim Maintainers 2015 - 2021
 */

#include <ctype.h>
#include <stdlib.h>
#include <string.h>

#include "debug.h"

using namespace std;

bit_table debug_options[] = {   /* alphabetical */
    { "all",      D_all },
    { "archive",  D_archive },
    { "classify", D_classify },
    { "cleanup",  D_cleanup },
    { "config",   D_config },
    { "exec",     D_exec },
    { "lock",     D_lock },
    { "mount",    D_mount },
    { "scrub",    D_scrub },
    { "share",    D_share },
    { "signal",   D_signal },
    { "volume",   D_volume },
};

int ndebug_options = sizeof(debug_options) / sizeof(*debug_options);


static const bit_table *lookupOption(const string &name) {
    int low = 0;
    int high = ndebug_options - 1;

    while (low <= high) {
        int middle = (low + high) / 2;
        int c = strcmp(name.c_str(), debug_options[middle].name);

        if (!c)
            return &debug_options[middle];

        if (c < 0)
            high = middle - 1;
        else
            low = middle + 1;
    }

    return NULL;
}


string decode_bits(unsigned int &selector, string parsestring) {
    size_t pos = 0;

    if (!parsestring.length())
        return "";

    // numeric form: =0x3f
    if (parsestring[0] == '=') {
        char *end;
        selector = (unsigned int)strtoul(parsestring.c_str() + 1, &end, 0);

        if (!*end)
            return "";

        return "unknown debugging selection: " + parsestring;
    }

    while (pos < parsestring.length()) {
        while (pos < parsestring.length() && isspace(parsestring[pos]))
            ++pos;

        if (pos >= parsestring.length())
            break;

        if (parsestring[pos] != '+' && parsestring[pos] != '-')
            return "unknown debugging flag (should be + or -): " + parsestring.substr(pos);

        bool adding = parsestring[pos++] == '+';
        size_t start = pos;

        while (pos < parsestring.length() && (isalnum(parsestring[pos]) || parsestring[pos] == '_'))
            ++pos;

        string name = parsestring.substr(start, pos - start);
        auto option = lookupOption(name);

        if (option == NULL)
            return string("unknown debugging selection: ") + (adding ? "+" : "-") + name;

        if (adding)
            selector |= option->bit;
        else
            selector &= ~option->bit;
    }

    return "";
}

#endif

