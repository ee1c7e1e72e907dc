
#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <map>
#include <set>
#include <string>
#include <vector>
#include <sys/types.h>

#include "report.h"

using namespace std;


// everything that launches an external tool goes through a CommandRunner
class CommandRunner {
public:
    virtual ~CommandRunner() {}

    // run argv to completion.  returns the exit status or -1 if it couldn't be started.
    virtual int run(const vector<string>& argv, bool showOutput = false) = 0;

    // stop every still-running process this runner started for tool.
    // returns the number that had to be killed.
    virtual int terminate(string tool, StatusReporter& reporter) = 0;
};


/*
 ExecRunner forks the real tools through PipeExec.  Child pids are tracked by
 tool name for as long as they run so that terminate() only ever signals
 processes this process spawned.
 */
class ExecRunner : public CommandRunner {
    map<string, set<pid_t>> live;
    double retryWait;
    int maxAttempts;

public:
    ExecRunner(double wait = 5.0, int attempts = 10) : retryWait(wait), maxAttempts(attempts) {}

    int run(const vector<string>& argv, bool showOutput = false);
    int terminate(string tool, StatusReporter& reporter);
};

// the tool an argv runs, looking through a leading sudo
string toolName(const vector<string>& argv);

// argv, prefixed with sudo when useSudo is set
vector<string> privileged(bool useSudo, vector<string> argv);

#endif
