
#ifndef PIPE_EXEC_H
#define PIPE_EXEC_H

#include <string>
#include <vector>
#include <sys/types.h>

/****************************************************************
 * PipeExec
 *
 * Execute a single external tool from an argument vector (no
 * shell is involved, so paths with spaces need no quoting).
 * STDERR of the child is redirected to a file under
 * TMP_OUTPUT_DIR so that it can be included in the failure
 * report instead of spilling across the screen.
 *
 * Example:
 *
 * PipeExec p({"cryptsetup", "status", "backup"});
 * p.execute("cryptsetup");
 * if (p.wait())
 *     cerr << p.errorOutput();
 *
 */

using namespace std;


class PipeExec {
    vector<string> args;
    string errorDir;
    string errorFile;
    string outputFile;
    pid_t childPID;
    int exitStatus;

    public:
        PipeExec(vector<string> argv);
        ~PipeExec();

        /* execute(procName, leaveFinalOutput)
         * Fork and exec the command.  procName names the subdir under TMP_OUTPUT_DIR that receives
         * the STDERR capture.  With leaveFinalOutput the child's STDOUT and STDERR stay on the
         * terminal (rsync and rclone progress), otherwise STDOUT is captured beside STDERR.
         * Returns the child's pid or -1 if the fork failed.
         */
        pid_t execute(string procName = "", bool leaveFinalOutput = false);

        // block until the child exits; returns its exit status, 128 + signal if
        // it was killed, or -1 if it couldn't be started
        int wait();

        string command();
        pid_t pid() { return childPID; }

        string errorOutput();
        void flushErrors();
};

string firstAvailIDForDir(string dir);

#endif
