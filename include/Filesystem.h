
#ifndef FILESYSTEM_H
#define FILESYSTEM_H

#include <functional>
#include <string>
#include <vector>

using namespace std;

enum entryType { etMissing, etFile, etDirectory, etSymlink, etOther };

// visitor for Filesystem::walk(); returning true descends into a directory entry
typedef function<bool(const string& path, entryType type, unsigned int depth)> walkCallback;


/*
 Filesystem is the seam every destructive tree operation runs through.  the
 entry points never follow symbolic links: a link is reported as etSymlink and
 removing it removes only the link.
 */
class Filesystem {
public:
    virtual ~Filesystem() {}

    virtual entryType typeOf(string path) = 0;

    // fills entries with the names (not paths) found in dir, without . and ..
    // returns 0 or an errno value
    virtual int listDirectory(string dir, vector<string>& entries) = 0;

    // unlink a file or link, rmdir a directory. returns 0 or an errno value
    virtual int removeEntry(string path, entryType type) = 0;

    // absolute, symlink-free form of path; blank if it can't be resolved
    virtual string resolve(string path) = 0;

    // remove path and everything below it, depth-first.
    // returns the number of entries that couldn't be removed.
    int removeTree(string path);

    // visit every entry below root (root itself excluded), breadth-first by
    // directory.  returns the number of directories that couldn't be read.
    int walk(string root, walkCallback callback);

    size_t countFiles(string root);
};


class LocalFilesystem : public Filesystem {
public:
    entryType typeOf(string path);
    int listDirectory(string dir, vector<string>& entries);
    int removeEntry(string path, entryType type);
    string resolve(string path);
};

string entryTypeName(entryType type);

#endif
