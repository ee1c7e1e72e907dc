
#include "PathClassifier.h"
#include "util_generic.h"
#include "debug.h"


string pathClassName(pathClass pc) {
    switch (pc) {
        case pcAllowed:              return "allowed";
        case pcForbiddenExact:       return "forbidden (protected root)";
        case pcForbiddenOutsideJail: return "forbidden (outside the jail)";
    }

    return "unknown";
}


bool pathWithin(string path, string root) {
    if (!root.length() || !path.length())
        return false;

    if (root.length() > 1 && root.back() == '/')
        root.pop_back();

    if (path == root)
        return true;

    if (root == "/")
        return path[0] == '/';

    return path.length() > root.length() && !path.compare(0, root.length(), root) && path[root.length()] == '/';
}


PathClassifier::PathClassifier(Filesystem& filesystem, string homeDir, string dataRootDir, string jailDir) :
    fs(filesystem), home(homeDir), dataRoot(dataRootDir), jail(jailDir) {
}


pathClass PathClassifier::classify(string candidate) {
    string resolved = candidate.length() ? fs.resolve(candidate) : "";

    if (!resolved.length()) {
        DEBUG(D_classify) DFMT(candidate << " can't be resolved");
        return pcForbiddenOutsideJail;
    }

    // the roots are resolved on every call too; one that doesn't exist protects nothing
    string realHome = home.length() ? fs.resolve(home) : "";
    string realData = dataRoot.length() ? fs.resolve(dataRoot) : "";
    string realJail = jail.length() ? fs.resolve(jail) : "";

    DEBUG(D_classify) DFMT(candidate << " -> " << resolved << " (home " << realHome << ", data " << realData << ", jail " << realJail << ")");

    if ((realHome.length() && resolved == realHome) || (realData.length() && resolved == realData))
        return pcForbiddenExact;

    if (pathWithin(resolved, realJail) || pathWithin(resolved, realData))
        return pcAllowed;

    return pcForbiddenOutsideJail;
}
