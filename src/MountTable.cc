
#include <fstream>
#include <sstream>

#include "MountTable.h"
#include "util_generic.h"
#include "debug.h"


string decodeMountField(string field) {
    string result;

    for (size_t pos = 0; pos < field.length(); ++pos) {
        if (field[pos] == '\\' && pos + 3 < field.length() &&
            field[pos + 1] >= '0' && field[pos + 1] <= '7' &&
            field[pos + 2] >= '0' && field[pos + 2] <= '7' &&
            field[pos + 3] >= '0' && field[pos + 3] <= '7') {

            result += (char)((field[pos + 1] - '0') * 64 + (field[pos + 2] - '0') * 8 + (field[pos + 3] - '0'));
            pos += 3;
        }
        else
            result += field[pos];
    }

    return result;
}


bool parseMountLine(string line, mountEntry& entry) {
    istringstream fields(line);
    string device, mountpoint, type;

    if (!(fields >> device >> mountpoint >> type))
        return false;

    entry.device = decodeMountField(device);
    entry.mountpoint = decodeMountField(mountpoint);
    entry.type = type;
    return true;
}


vector<mountEntry> ProcMounts::entries() {
    vector<mountEntry> result;
    ifstream mounts(filename);
    string line;

    if (!mounts.is_open()) {
        log("error: unable to read " + filename + errtext());
        return result;
    }

    while (getline(mounts, line)) {
        mountEntry entry;

        if (parseMountLine(line, entry))
            result.push_back(entry);
    }

    return result;
}


bool MountTable::isMounted(string device, string mountpoint) {
    if (mountpoint.length() > 1 && mountpoint.back() == '/')
        mountpoint.pop_back();

    for (auto &entry: entries())
        if (entry.device == device && entry.mountpoint == mountpoint) {
            DEBUG(D_mount) DFMT(device << " is mounted on " << mountpoint);
            return true;
        }

    DEBUG(D_mount) DFMT(device << " is not mounted on " << mountpoint);
    return false;
}


bool MountTable::isMountpoint(string mountpoint) {
    if (mountpoint.length() > 1 && mountpoint.back() == '/')
        mountpoint.pop_back();

    for (auto &entry: entries())
        if (entry.mountpoint == mountpoint)
            return true;

    return false;
}
