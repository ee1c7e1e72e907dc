
#include <dirent.h>
#include <errno.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>
#include <list>
#include <tuple>

#include "Filesystem.h"
#include "util_generic.h"
#include "debug.h"


string entryTypeName(entryType type) {
    switch (type) {
        case etMissing:   return "missing";
        case etFile:      return "file";
        case etDirectory: return "directory";
        case etSymlink:   return "symlink";
        default:          return "special";
    }
}


int Filesystem::removeTree(string path) {
    auto type = typeOf(path);
    int failures = 0;

    if (type == etMissing)
        return 0;

    if (type == etDirectory) {
        vector<string> entries;

        if (int err = listDirectory(path, entries)) {
            log("error: unable to read " + path + " - " + strerror(err));
            return 1;
        }

        for (auto &entry: entries)
            failures += removeTree(slashConcat(path, entry));
    }

    if (int err = removeEntry(path, type)) {
        log("error: unable to remove " + path + " - " + strerror(err));
        ++failures;
    }

    return failures;
}


int Filesystem::walk(string root, walkCallback callback) {
    list<tuple<string, unsigned int>> dirsToRead;   // path and depth in the hierarchy
    int failures = 0;

    dirsToRead.push_back({root, 0});

    while (!dirsToRead.empty()) {
        auto [baseDir, depth] = dirsToRead.front();
        dirsToRead.pop_front();

        vector<string> entries;
        if (int err = listDirectory(baseDir, entries)) {
            log("error: unable to read " + baseDir + " - " + strerror(err));
            ++failures;
            continue;
        }

        for (auto &entry: entries) {
            string fullPath = slashConcat(baseDir, entry);
            auto type = typeOf(fullPath);

            if (callback(fullPath, type, depth + 1) && type == etDirectory)
                dirsToRead.push_back({fullPath, depth + 1});
        }
    }

    return failures;
}


size_t Filesystem::countFiles(string root) {
    size_t count = 0;

    walk(root, [&](const string& path, entryType type, unsigned int depth) {
        if (type == etFile)
            ++count;
        return true;
    });

    return count;
}


entryType LocalFilesystem::typeOf(string path) {
    struct stat statData;

    if (mylstat(path, &statData))
        return etMissing;

    if (S_ISLNK(statData.st_mode))
        return etSymlink;

    if (S_ISDIR(statData.st_mode))
        return etDirectory;

    if (S_ISREG(statData.st_mode))
        return etFile;

    return etOther;
}


int LocalFilesystem::listDirectory(string dir, vector<string>& entries) {
    DIR *dirPtr;
    struct dirent *dirEntry;

    if ((dirPtr = opendir(dir.c_str())) == NULL)
        return errno;

    while ((dirEntry = readdir(dirPtr)) != NULL) {
        if (!strcmp(dirEntry->d_name, ".") || !strcmp(dirEntry->d_name, ".."))
            continue;

        entries.push_back(dirEntry->d_name);
    }

    closedir(dirPtr);
    return 0;
}


int LocalFilesystem::removeEntry(string path, entryType type) {
    int result = type == etDirectory ? rmdir(path.c_str()) : unlink(path.c_str());
    int err = result ? errno : 0;

    DEBUG(D_scrub) DFMT("removed " << entryTypeName(type) << " " << path << (err ? string(" - ") + strerror(err) : ""));
    return err;
}


string LocalFilesystem::resolve(string path) {
    return realpathcpp(path);
}
