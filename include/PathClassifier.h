
#ifndef PATHCLASSIFIER_H
#define PATHCLASSIFIER_H

#include <string>

#include "Filesystem.h"

using namespace std;

enum pathClass { pcAllowed, pcForbiddenExact, pcForbiddenOutsideJail };


/*******************************************************************************
 * PathClassifier
 *
 * Decides whether a directory may be the target of a destructive scrub.  The
 * candidate is resolved first.  It's forbidden outright if it's the home
 * directory or the data root itself, and forbidden unless it equals or lies
 * below the jail or the data root.  Roots compare by whole path components,
 * so /mnt/data2 isn't below /mnt/data.  Nothing is cached: every call looks
 * at the filesystem as it is now.
 *******************************************************************************/
class PathClassifier {
    Filesystem& fs;
    string home;
    string dataRoot;
    string jail;

public:
    PathClassifier(Filesystem& filesystem, string homeDir, string dataRootDir, string jailDir);

    pathClass classify(string candidate);
};

string pathClassName(pathClass pc);

// true when path is root or lies below it
bool pathWithin(string path, string root);

#endif
