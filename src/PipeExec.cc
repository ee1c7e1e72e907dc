#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <dirent.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <vector>
#include "pcre++.h"
#include "util_generic.h"
#include "globals.h"
#include "PipeExec.h"
#include "debug.h"

using namespace std;
using namespace pcrepp;


PipeExec::PipeExec(vector<string> argv) {
    args = argv;
    childPID = -1;
    exitStatus = -1;
}


PipeExec::~PipeExec() {
    if (childPID > 0 && exitStatus == -1)
        waitpid(childPID, NULL, WNOHANG);

    flushErrors();
}


void PipeExec::flushErrors() {
    if (errorFile.length())
        unlink(errorFile.c_str());

    if (outputFile.length())
        unlink(outputFile.c_str());

    if (errorDir.length())
        rmdir(errorDir.c_str());    // only succeeds once every capture in it is gone
}


string PipeExec::command() {
    return perlJoin(" ", args);
}


pid_t PipeExec::execute(string procName, bool leaveFinalOutput) {
    if (!args.size())
        return -1;

    errorDir = string(TMP_OUTPUT_DIR) + "/" + (procName.length() ? safeFilename(procName) : "pid_" + to_string(getpid())) + "/";
    mkdirp(errorDir);
    string commandID = firstAvailIDForDir(errorDir);
    string commandPrefix = pathSplit(args[0]).file;

    if (!leaveFinalOutput) {
        errorFile = errorDir + commandID + ":0." + safeFilename(commandPrefix) + ".stderr";
        outputFile = errorDir + commandID + ":0." + safeFilename(commandPrefix) + ".stdout";
    }

    DEBUG(D_exec) DFMT("executing [" << command() << "]");

    // build the argv before forking so the child only execs
    vector<char*> params;
    for (auto &arg: args)
        params.push_back(const_cast<char*>(arg.c_str()));
    params.push_back(NULL);

    if ((childPID = fork()) < 0) {
        log("error: unable to fork for " + command() + errtext());
        return -1;
    }

    if (childPID) {
        // PARENT
        return childPID;
    }

    // CHILD
    if (!leaveFinalOutput) {
        int errorFd = open(errorFile.c_str(), O_CREAT | O_WRONLY | O_TRUNC, S_IRUSR | S_IWUSR);
        if (errorFd > 0)
            DUP2(errorFd, 2);
        else {
            string msg = "warning: unable to redirect STDERR of subprocess to " + errorFile + " (" + strerror(errno) + ")";
            SCREENERR(msg);
            log(msg);
        }

        int outFd = open(outputFile.c_str(), O_CREAT | O_WRONLY | O_TRUNC, S_IRUSR | S_IWUSR);
        if (outFd > 0)
            DUP2(outFd, 1);
    }

    // signals the parent traps are restored to their defaults in the child
    signal(SIGHUP, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    signal(SIGQUIT, SIG_DFL);
    signal(SIGABRT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);

    // nor stay blocked when the child is started from inside a handler
    sigset_t unblocked;
    sigemptyset(&unblocked);
    sigprocmask(SIG_SETMASK, &unblocked, NULL);

    execvp(params[0], params.data());

    cerr << "unable to execute " << args[0] << ": " << strerror(errno) << endl;
    _exit(127);
}


int PipeExec::wait() {
    int status;
    pid_t result;

    if (childPID <= 0)
        return -1;

    if (exitStatus != -1)
        return exitStatus;

    while ((result = waitpid(childPID, &status, 0)) < 0 && errno == EINTR);

    if (result < 0)
        return -1;

    if (WIFEXITED(status))
        exitStatus = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        exitStatus = 128 + WTERMSIG(status);

    DEBUG(D_exec) DFMT(args[0] << " (pid " << childPID << ") exited with " << exitStatus);
    return exitStatus;
}


string PipeExec::errorOutput() {
    if (!errorFile.length())
        return "";

    ifstream errorStream(errorFile);
    stringstream buffer;

    if (errorStream.is_open())
        buffer << errorStream.rdbuf();

    return trimSpace(buffer.str());
}


string firstAvailIDForDir(string dir) {
    DIR *c_dir;
    struct dirent *c_dirEntry;
    string lastID = "";

    if ((c_dir = opendir(dir.c_str())) != NULL) {
        while ((c_dirEntry = readdir(c_dir)) != NULL) {
            if (!strcmp(c_dirEntry->d_name, ".") || !strcmp(c_dirEntry->d_name, ".."))
                continue;

            auto filename = string(c_dirEntry->d_name);
            auto delimit = filename.find(":");

            if (delimit != string::npos) {
                auto id = filename.substr(0, delimit);

                if (lastID < id)
                    lastID = id;
            }
        }

        closedir(c_dir);
    }

    if (!lastID.length())
        return "A";

    char lastLetter = lastID.back();
    if (lastLetter == 'Z')
        return(lastID + "A");

    char result[100];
    snprintf(result, sizeof(result), "%s%c", lastID.substr(0, lastID.length() - 1).c_str(), (char)(lastLetter + 1));
    return(result);
}
