
#include <errno.h>
#include <signal.h>
#include <sys/wait.h>

#include "CommandRunner.h"
#include "PipeExec.h"
#include "util_generic.h"
#include "debug.h"


string toolName(const vector<string>& argv) {
    size_t index = 0;

    if (argv.size() > 1 && pathSplit(argv[0]).file == "sudo")
        index = 1;

    return argv.size() ? pathSplit(argv[index]).file : "";
}


vector<string> privileged(bool useSudo, vector<string> argv) {
    if (useSudo)
        argv.insert(argv.begin(), "sudo");

    return argv;
}


int ExecRunner::run(const vector<string>& argv, bool showOutput) {
    string tool = toolName(argv);
    PipeExec proc(argv);

    pid_t pid = proc.execute(tool, showOutput);
    if (pid < 0)
        return -1;

    live[tool].insert(pid);
    int status = proc.wait();
    live[tool].erase(pid);

    if (status) {
        string errors = proc.errorOutput();
        log("error: [" + proc.command() + "] exited with " + to_string(status) + (errors.length() ? ": " + errors : ""));

        if (errors.length() && !showOutput && NOTQUIET)
            SCREENERR(errors);
    }

    return status;
}


int ExecRunner::terminate(string tool, StatusReporter& reporter) {
    auto it = live.find(tool);
    int killed = 0;

    if (it == live.end() || it->second.empty()) {
        DEBUG(D_exec) DFMT("no " << tool << " processes running");
        return 0;
    }

    auto &pids = it->second;
    reporter.note("terminating " + plural(pids.size(), tool + " process") + " . . .");

    for (auto pid: pids) {
        DEBUG(D_exec) DFMT("SIGTERM " << tool << " pid " << pid);
        kill(pid, SIGTERM);
    }

    for (int attempt = 0; attempt < maxAttempts && !pids.empty(); ++attempt) {
        for (auto pidIt = pids.begin(); pidIt != pids.end(); ) {
            pid_t result = waitpid(*pidIt, NULL, WNOHANG);

            // reaped, or no longer ours to wait on
            if (result == *pidIt || (result < 0 && errno == ECHILD))
                pidIt = pids.erase(pidIt);
            else
                ++pidIt;
        }

        if (!pids.empty())
            sleepFor(retryWait);
    }

    for (auto pid: pids) {
        reporter.error(tool + " pid " + to_string(pid) + " ignored SIGTERM; sending SIGKILL");
        kill(pid, SIGKILL);
        while (waitpid(pid, NULL, 0) < 0 && errno == EINTR);
        ++killed;
    }

    pids.clear();
    return killed;
}
