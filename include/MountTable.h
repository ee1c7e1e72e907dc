
#ifndef MOUNTTABLE_H
#define MOUNTTABLE_H

#include <string>
#include <vector>

using namespace std;

struct mountEntry {
    string device;
    string mountpoint;
    string type;
};


class MountTable {
public:
    virtual ~MountTable() {}

    virtual vector<mountEntry> entries() = 0;

    bool isMounted(string device, string mountpoint);
    bool isMountpoint(string mountpoint);
};


// reads the kernel's table of mounts (/proc/mounts by default)
class ProcMounts : public MountTable {
    string filename;

public:
    ProcMounts(string file = "/proc/mounts") : filename(file) {}

    vector<mountEntry> entries();
};

// undo the octal escapes (\040 for a space) the kernel uses in mount tables
string decodeMountField(string field);

// parse one line of a mount table; false if the line is malformed
bool parseMountLine(string line, mountEntry& entry);

#endif
